// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../triton/socket/socket_stream.hpp"
#include "../triton/socket/websocket_dispatcher.hpp"
#include "../triton/http/websocket_frame_parser.hpp"
#include <sys/socket.h>
#include <poll.h>
using namespace ::triton;

int
main()
  {
    int fds[2];
    TRITON_TEST_CHECK(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0);
    unique_posix_fd fd0(fds[0]);
    unique_posix_fd peer(fds[1]);

    Socket_Stream stream(move(fd0));
    TRITON_TEST_CHECK(stream.throttle_size() == 1048576);
    TRITON_TEST_CHECK(stream.poll_events() == POLLIN);
    TRITON_TEST_CHECK(stream.pending_size() == 0);

    // The peer does not read, so data pile up after the socket buffer fills.
    stream.set_throttle_size(4096);
    char chunk[4096];
    ::memset(chunk, '*', sizeof(chunk));
    size_t sent = 0;
    while(stream.pending_size() <= stream.throttle_size()) {
      TRITON_TEST_CHECK(stream.stream_send(chars_view(chunk, sizeof(chunk))));
      sent += sizeof(chunk);
      TRITON_TEST_CHECK(sent < 100000000);
    }

    // Reading is suspended until the queue drains.
    TRITON_TEST_CHECK((stream.poll_events() & POLLIN) == 0);
    TRITON_TEST_CHECK((stream.poll_events() & POLLOUT) != 0);

    char rbuf[65536];
    size_t received = 0;
    while(stream.pending_size() != 0) {
      ::ssize_t n = ::recv(peer.get(), rbuf, sizeof(rbuf), MSG_DONTWAIT);
      if(n > 0)
        received += static_cast<size_t>(n);
      TRITON_TEST_CHECK(stream.on_writable());
    }
    TRITON_TEST_CHECK(stream.poll_events() == POLLIN);

    for(;;) {
      ::ssize_t n = ::recv(peer.get(), rbuf, sizeof(rbuf), MSG_DONTWAIT);
      if(n <= 0)
        break;
      received += static_cast<size_t>(n);
    }
    TRITON_TEST_CHECK(received == sent);

    // Throttling by the consumer also suspends reading.
    stream.stream_throttle(true);
    TRITON_TEST_CHECK(stream.poll_events() == 0);
    stream.stream_throttle(false);
    TRITON_TEST_CHECK(stream.poll_events() == POLLIN);

    // A peer that floods PING frames and never reads cannot make PONG frames
    // accumulate without bound.
    TRITON_TEST_CHECK(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0);
    unique_posix_fd fd2(fds[0]);
    unique_posix_fd peer2(fds[1]);
    Socket_Stream stream2(move(fd2));
    stream2.set_throttle_size(4096);
    WebSocket_Dispatcher disp(stream2, ws_role_server);

    char payload[125];
    ::memset(payload, 'p', sizeof(payload));
    tinyfmt_str fmt;
    encode_websocket_frame(fmt, ws_PING, true, 0x1A2B3C4DU, chars_view(payload, sizeof(payload)));

    size_t pings = 0;
    WebSocket_Message msg;
    while(stream2.poll_events() & POLLIN) {
      linear_buffer data;
      data.putn(fmt.data(), fmt.size());
      disp.on_stream_data(data, false);
      TRITON_TEST_CHECK(data.empty());
      while(disp.next_message(msg))
        TRITON_TEST_CHECK(msg.is_ping());

      pings ++;
      TRITON_TEST_CHECK(pings < 10000000);
    }

    // Each PONG frame takes 127 bytes.
    TRITON_TEST_CHECK(disp.state() == ws_dispatcher_open);
    TRITON_TEST_CHECK(stream2.pending_size() > stream2.throttle_size());
    TRITON_TEST_CHECK(stream2.pending_size() <= stream2.throttle_size() + 127);
    TRITON_TEST_CHECK(disp.stats().frames_out == pings);
  }
