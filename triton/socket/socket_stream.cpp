// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "socket_stream.hpp"
#include "../base/config_file.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
#include <sys/socket.h>
#include <fcntl.h>
#include <poll.h>
namespace triton {

Socket_Stream::
Socket_Stream(unique_posix_fd&& fd)
  :
    m_fd(move(fd))
  {
    if(!this->m_fd)
      TRITON_THROW(("Null socket handle not valid"));

    int fl_old = ::fcntl(this->fd(), F_GETFL);
    if(fl_old == -1)
      TRITON_THROW((
          "Could not get socket flags",
          "[`fcntl()` failed: ${errno:full}]"));

    if(::fcntl(this->fd(), F_SETFL, fl_old | O_NONBLOCK) != 0)
      TRITON_THROW((
          "Could not enable non-blocking mode",
          "[`fcntl()` failed: ${errno:full}]"));

    this->m_state.store(socket_established);
    this->m_throttled.store(false);

    const auto conf_file = main_config.copy();
    this->m_throttle_size = static_cast<size_t>(
        conf_file.get_integer_opt(sref("network.poll.throttle_size"), 0x100, 0x7FFFFFF0)
        .value_or(static_cast<int64_t>(this->m_throttle_size)));
  }

Socket_Stream::
~Socket_Stream()
  {
  }

short
Socket_Stream::
poll_events() const noexcept
  {
    short events = 0;
    if(this->socket_state() == socket_closed)
      return events;

    recursive_mutex::unique_lock io_lock(this->m_io_mutex);
    size_t pending = this->m_write_queue.size();

    // When there are too many pending bytes, stop reading until some bytes
    // can be transferred.
    if(!this->m_throttled.load() && (pending <= this->m_throttle_size))
      events |= POLLIN;

    if((pending != 0) || (this->socket_state() == socket_closing))
      events |= POLLOUT;
    return events;
  }

size_t
Socket_Stream::
pending_size() const noexcept
  {
    recursive_mutex::unique_lock io_lock(this->m_io_mutex);
    return this->m_write_queue.size();
  }

bool
Socket_Stream::
on_readable(linear_buffer& data, bool& eof)
  {
    eof = false;
    if(this->socket_state() == socket_closed)
      return true;

    for(;;) {
      data.reserve_after_end(0xFFFF);
      ::ssize_t ior = ::recv(this->fd(), data.mut_end(), data.capacity_after_end(), 0);
      if(ior < 0) {
        if(errno == EINTR)
          continue;

        if((errno == EAGAIN) || (errno == EWOULDBLOCK))
          return true;

        int err = errno;
        TRITON_LOG_DEBUG(("Socket read error: ${errno:full}"));

        // The connection is now broken.
        this->quick_shut_down();
        errno = err;
        return false;
      }

      if(ior == 0) {
        TRITON_LOG_DEBUG(("Received EOF from socket `$1`"), this->fd());
        eof = true;
        return true;
      }

      data.accept(static_cast<size_t>(ior));
      TRITON_LOG_TRACE(("Socket `$1` IN: $2 bytes"), this->fd(), ior);
    }
  }

bool
Socket_Stream::
on_writable()
  {
    recursive_mutex::unique_lock io_lock(this->m_io_mutex);
    auto& queue = this->m_write_queue;

    for(;;) {
      if(queue.empty()) {
        if(!this->do_test_change(socket_closing, socket_closed))
          return true;

        // The socket state has been changed from CLOSING to CLOSED, so close
        // the connection.
        TRITON_LOG_DEBUG(("Sending EOF to socket `$1`"), this->fd());
        ::shutdown(this->fd(), SHUT_RDWR);
        return true;
      }

      ::ssize_t ior = ::send(this->fd(), queue.begin(), queue.size(), MSG_NOSIGNAL);
      if(ior < 0) {
        if(errno == EINTR)
          continue;

        if((errno == EAGAIN) || (errno == EWOULDBLOCK))
          return true;

        int err = errno;
        TRITON_LOG_DEBUG(("Socket write error: ${errno:full}"));

        // The connection is now broken.
        this->quick_shut_down();
        errno = err;
        return false;
      }

      // Discard sent data.
      queue.discard(static_cast<size_t>(ior));
      TRITON_LOG_TRACE(("Socket `$1` OUT: $2 bytes"), this->fd(), ior);
    }
  }

bool
Socket_Stream::
quick_shut_down() noexcept
  {
    if(this->m_state.xchg(socket_closed) == socket_closed)
      return false;

    ::shutdown(this->fd(), SHUT_RDWR);
    return true;
  }

bool
Socket_Stream::
stream_send(chars_view data)
  {
    if(this->socket_state() >= socket_closing)
      return false;

    recursive_mutex::unique_lock io_lock(this->m_io_mutex);
    auto& queue = this->m_write_queue;

    // Reserve storage for the sake of exception safety.
    queue.reserve_after_end(data.n);

    if(queue.empty()) {
      // Send until the operation would block.
      chars_view window = data;
      for(;;) {
        if(window.n == 0)
          return true;

        ::ssize_t ior = ::send(this->fd(), window.p, window.n, MSG_NOSIGNAL);
        if(ior < 0) {
          if(errno == EINTR)
            continue;

          if((errno == EAGAIN) || (errno == EWOULDBLOCK)) {
            // Stash remaining data, and wait for the next writability
            // notification. Storage has been reserved so this will not throw
            // any exceptions.
            ::memcpy(queue.mut_end(), window.p, window.n);
            queue.accept(window.n);
            return true;
          }

          TRITON_LOG_DEBUG(("Socket write error: ${errno:full}"));

          // The connection is now broken.
          this->quick_shut_down();
          return false;
        }

        // Discard sent data.
        window >>= static_cast<size_t>(ior);
      }
    }
    else {
      // If a previous write operation would have blocked, append `data` to
      // `queue`, and wait for the next writability notification.
      ::memcpy(queue.mut_end(), data.p, data.n);
      queue.accept(data.n);
      return true;
    }
  }

void
Socket_Stream::
stream_throttle(bool throttle)
  {
    if(this->m_throttled.xchg(throttle) != throttle)
      TRITON_LOG_TRACE(("Socket `$1` throttled: $2"), this->fd(), throttle);
  }

bool
Socket_Stream::
stream_shut_down() noexcept
  {
    if(this->socket_state() >= socket_closing)
      return false;

    recursive_mutex::unique_lock io_lock(this->m_io_mutex);
    if(this->m_write_queue.empty())
      return this->quick_shut_down();

    // Close the socket once all data have been sent. The state shall not go
    // backwards.
    return this->do_test_change(socket_established, socket_closing);
  }

}  // namespace triton
