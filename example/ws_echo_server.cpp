// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../triton/xprecompiled.hpp"
#include "../triton/base/config_file.hpp"
#include "../triton/static/main_config.hpp"
#include "../triton/static/logger.hpp"
#include "../triton/http/http_request_parser.hpp"
#include "../triton/http/http_response_headers.hpp"
#include "../triton/http/websocket_handshake.hpp"
#include "../triton/socket/socket_stream.hpp"
#include "../triton/socket/websocket_dispatcher.hpp"
#include "../triton/utils.hpp"
#include <locale.h>
#include <stdlib.h>
#include <time.h>
#include <signal.h>
#include <stdarg.h>
#include <pthread.h>
#include <poll.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>
namespace {
using namespace triton;

[[noreturn]]
int
do_print_help_and_exit(const char* self)
  {
    ::printf(
//        1         2         3         4         5         6         7     |
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
"""""""""""""""""""""""""""""""""""""""""""""""""""""""""" R"'''''''''''''''(
Usage: %s [OPTIONS]

  -c FILE  load configuration from FILE
  -p PORT  listen on PORT (default: 3806)
  -h       show help message then exit
  -V       show version information then exit
  -v       enable verbose mode

Every text or binary message that a client sends is echoed back. The server
shuts connections down gracefully upon SIGINT or SIGTERM.

Report bugs to <%s>.
)'''''''''''''''" """"""""""""""""""""""""""""""""""""""""""""""""""""""""+1,
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
//        1         2         3         4         5         6         7     |
      self,
      PACKAGE_BUGREPORT);

    ::fflush(nullptr);
    ::quick_exit(0);
  }

[[noreturn]]
int
do_print_version_and_exit()
  {
    ::printf("%s\n", PACKAGE_STRING);
    ::fflush(nullptr);
    ::quick_exit(0);
  }

struct Command_Line_Options
  {
    // options
    cow_string conf_path;
    uint16_t port = 3806;
    bool verbose = false;
  };

atomic_relaxed<int> exit_signal;
Command_Line_Options cmdline;

enum
  {
    exit_success            = 0,
    exit_system_error       = 1,
    exit_invalid_argument   = 2,
  };

[[noreturn]] ROCKET_NEVER_INLINE
int
do_exit_printf(int code, const char* fmt = nullptr, ...) noexcept
  {
    // Wait for pending logs to be flushed.
    ::fflush(nullptr);
    logger.synchronize();

    if(fmt) {
      ::va_list ap;
      va_start(ap, fmt);
      ::vfprintf(stderr, fmt, ap);
      va_end(ap);
    }

    ::fputc('\n', stderr);
    ::quick_exit(code);
  }

ROCKET_NEVER_INLINE
void
do_parse_command_line(int argc, char** argv)
  {
    bool help = false;
    bool version = false;
    char* eptr;
    unsigned long port;

    int ch;
    while((ch = ::getopt(argc, argv, "c:p:hVv")) != -1)
      switch(ch)
        {
        case 'c':
          cmdline.conf_path.assign(::optarg);
          break;

        case 'p':
          port = ::strtoul(::optarg, &eptr, 10);
          if((*eptr != 0) || (port == 0) || (port > 65535))
            do_exit_printf(exit_invalid_argument,
                "%s: invalid port number -- '%s'", argv[0], ::optarg);

          cmdline.port = static_cast<uint16_t>(port);
          break;

        case 'h':
          help = true;
          break;

        case 'V':
          version = true;
          break;

        case 'v':
          cmdline.verbose = true;
          break;

        default:
          do_exit_printf(exit_invalid_argument,
              "%s: invalid argument -- '%c'\nTry `%s -h` for help.",
              argv[0], ::optopt, argv[0]);
        }

    if(help)
      do_print_help_and_exit(argv[0]);

    if(version)
      do_print_version_and_exit();

    if(::optind != argc)
      do_exit_printf(exit_invalid_argument,
          "%s: unexpected argument -- '%s'\nTry `%s -h` for help.",
          argv[0], argv[::optind], argv[0]);
  }

ROCKET_NEVER_INLINE
void
do_create_logger_thread()
  {
    ::pthread_t thrd;
    int err = ::pthread_create(
      &thrd,
      nullptr,
      +[](void*) -> void*
      {
        ::sigset_t sigset;
        ::sigemptyset(&sigset);
        ::sigaddset(&sigset, SIGINT);
        ::sigaddset(&sigset, SIGTERM);
        ::pthread_sigmask(SIG_BLOCK, &sigset, nullptr);

        for(;;)
          try {
            logger.thread_loop();
          }
          catch(exception& stdex) {
            ::fprintf(stderr,
                "WARNING: Caught an exception from thread loop: %s\n"
                "[exception class `%s`]\n",
                stdex.what(), typeid(stdex).name());
          }
      },
      nullptr
    );

    if(err != 0)
      do_exit_printf(exit_system_error, "Could not spawn logger thread: %s", ::strerror(err));

    // Name the thread and detach it. Errors are ignored.
    ::pthread_setname_np(thrd, "logger");
    ::pthread_detach(thrd);
  }

ROCKET_NEVER_INLINE
void
do_init_signal_handlers()
  {
    struct sigaction sigact = { };
    sigact.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &sigact, nullptr);

    // `accept()` and `poll()` shall be interrupted, so `SA_RESTART` is not set.
    sigact.sa_flags = 0;
    sigact.sa_handler = +[](int n) { exit_signal.store(n);  };
    ::sigaction(SIGINT, &sigact, nullptr);
    ::sigaction(SIGTERM, &sigact, nullptr);
  }

unique_posix_fd
do_create_listener()
  {
    unique_posix_fd fd(::socket(AF_INET6, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP));
    if(!fd)
      do_exit_printf(exit_system_error, "Could not create socket: %m");

    // Accept IPv4 connections as well.
    int ival = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &ival, sizeof(ival));
    ival = 0;
    ::setsockopt(fd.get(), IPPROTO_IPV6, IPV6_V6ONLY, &ival, sizeof(ival));

    ::sockaddr_in6 addr = { };
    addr.sin6_family = AF_INET6;
    addr.sin6_port = static_cast<uint16_t>(ROCKET_HTOBE16(cmdline.port));
    addr.sin6_addr = in6addr_any;
    if(::bind(fd.get(), reinterpret_cast<::sockaddr*>(&addr), sizeof(addr)) != 0)
      do_exit_printf(exit_system_error, "Could not bind socket to port %d: %m", cmdline.port);

    if(::listen(fd.get(), SOMAXCONN) != 0)
      do_exit_printf(exit_system_error, "Could not listen on socket: %m");

    return fd;
  }

// Waits for an event on `stream`. The result is `-1` if a signal has been
// caught, or the `revents` field otherwise.
int
do_poll_stream(const Socket_Stream& stream, short events, int timeout_ms)
  {
    ::pollfd pfd = { stream.fd(), events, 0 };
    int r = ::poll(&pfd, 1, timeout_ms);
    if(r < 0)
      return -1;
    return pfd.revents;
  }

// Flushes pending data, until the socket is closed or a few seconds elapse.
void
do_flush_and_close(Socket_Stream& stream)
  {
    stream.stream_shut_down();
    auto deadline = steady_clock::now() + seconds(5);
    while(stream.socket_state() != socket_closed) {
      if(steady_clock::now() >= deadline) {
        stream.quick_shut_down();
        break;
      }

      int revents = do_poll_stream(stream, POLLOUT, 200);
      if((revents > 0) && !stream.on_writable())
        break;
    }
  }

// Reads the HTTP request and performs the opening handshake. If the client
// may speak WebSocket, `true` is returned. Bytes following the request are
// left in `data`.
bool
do_accept_handshake(Socket_Stream& stream, linear_buffer& data)
  {
    HTTP_Request_Parser parser;
    bool eof = false;
    auto deadline = steady_clock::now() + seconds(30);

    while(!parser.headers_complete() && !parser.error()) {
      if(eof || (exit_signal.load() != 0) || (steady_clock::now() >= deadline))
        return false;

      int revents = do_poll_stream(stream, POLLIN, 1000);
      if(revents <= 0)
        continue;

      if(!stream.on_readable(data, eof))
        return false;

      parser.parse_headers_from_stream(data, eof);
    }

    HTTP_Response_Headers resp;
    if(parser.error()) {
      TRITON_LOG_WARN(("Bad HTTP request from socket `$1`: $2"),
                      stream.fd(), parser.error_description());

      resp.status = parser.http_status_from_error();
      resp.headers.emplace_back(sref("Connection"), sref("close"));
      resp.headers.emplace_back(sref("Content-Length"), sref("0"));
      tinyfmt_str fmt;
      resp.encode(fmt);
      stream.stream_send(fmt);
      return false;
    }

    TRITON_LOG_INFO(("WebSocket request from socket `$1`: $2"),
                    stream.fd(), parser.headers().uri);

    auto err = accept_websocket_handshake(resp, parser.headers());
    tinyfmt_str fmt;
    resp.encode(fmt);
    if(!stream.stream_send(fmt))
      return false;

    return err == ws_handshake_ok;
  }

void
do_serve_client(unique_posix_fd&& fd)
  {
    Socket_Stream stream(move(fd));
    linear_buffer data;

    if(!do_accept_handshake(stream, data)) {
      do_flush_and_close(stream);
      return;
    }

    WebSocket_Dispatcher disp(stream, ws_role_server);
    if(!data.empty())
      disp.on_stream_data(data, false);

    WebSocket_Message msg;
    bool eof = false;
    while(!disp.finished()) {
      while(disp.next_message(msg)) {
        TRITON_LOG_DEBUG(("Message from socket `$1`: $2"), stream.fd(), msg);

        if(msg.is_text() || msg.is_binary()) {
          if(disp.state() == ws_dispatcher_open)
            disp.send(msg);
        }
        else if(msg.is_close()) {
          auto st = disp.stats();
          TRITON_LOG_INFO((
              "WebSocket connection on socket `$1` closed: $2",
              "[frames in: $3, bytes in: $4, frames out: $5, bytes out: $6]"),
              stream.fd(), msg, st.frames_in, st.bytes_in, st.frames_out, st.bytes_out);
        }
      }

      if(exit_signal.load() != 0)
        disp.shut_down(WebSocket_Close_Reason(ws_status_going_away, sref("Server shutting down")));

      disp.check_close_timeout(steady_clock::now());

      if(stream.socket_state() == socket_closed) {
        disp.on_stream_closed(0);
        continue;
      }

      // While reading is suspended, this may be zero, and `poll()` only
      // waits.
      int revents = do_poll_stream(stream, stream.poll_events(), 200);
      if(revents <= 0)
        continue;

      if(revents & (POLLIN | POLLHUP | POLLERR)) {
        if(!stream.on_readable(data, eof))
          disp.on_stream_closed(errno);
        else
          disp.on_stream_data(data, eof);
      }

      if(revents & POLLOUT) {
        if(!stream.on_writable())
          disp.on_stream_closed(errno);
      }
    }

    do_flush_and_close(stream);
  }

}  // namespace

int
main(int argc, char** argv)
  try {
    ::setlocale(LC_ALL, "C.UTF-8");
    ::tzset();
    ::pthread_setname_np(::pthread_self(), "triton");

    // Note that this function shall not return in case of errors.
    do_parse_command_line(argc, argv);
    if(!cmdline.conf_path.empty())
      main_config.reload(cmdline.conf_path);

    logger.reload(main_config.copy(), cmdline.verbose);
    do_create_logger_thread();
    do_init_signal_handlers();

    auto listener = do_create_listener();
    TRITON_LOG_INFO(("$1 listening on port $2"), PACKAGE_STRING, cmdline.port);

    // Serve one client at a time until a stop signal has been received.
    while(exit_signal.load() == 0) {
      ::sockaddr_in6 addr;
      ::socklen_t addrlen = sizeof(addr);
      unique_posix_fd fd(::accept4(listener.get(), reinterpret_cast<::sockaddr*>(&addr), &addrlen,
                                   SOCK_CLOEXEC));
      if(!fd) {
        if(errno != EINTR)
          TRITON_LOG_WARN(("Could not accept connection: ${errno:full}"));
        continue;
      }

      char sbuf[INET6_ADDRSTRLEN];
      ::inet_ntop(AF_INET6, &(addr.sin6_addr), sbuf, sizeof(sbuf));
      TRITON_LOG_INFO(("Accepted connection from [$1]:$2"), sbuf, ROCKET_BETOH16(addr.sin6_port));

      try {
        do_serve_client(move(fd));
      }
      catch(exception& stdex) {
        TRITON_LOG_ERROR(("Connection from [$1] aborted: $2"), sbuf, stdex);
      }
    }

    int sig = exit_signal.load();
    TRITON_LOG_INFO(("Shutting down (signal $1: $2)"), sig, ::strsignal(sig));
    do_exit_printf(exit_success);
  }
  catch(exception& stdex) {
    TRITON_LOG_FATAL(("$1"), stdex);
    do_exit_printf(exit_system_error, "%s", stdex.what());
  }
