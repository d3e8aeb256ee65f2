// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_SOCKET_SOCKET_STREAM_
#define TRITON_SOCKET_SOCKET_STREAM_

#include "../fwd.hpp"
#include "enums.hpp"
#include "abstract_stream.hpp"
namespace triton {

// This is a stream on a connected socket. The socket is put into non-blocking
// mode, and data that cannot be sent immediately are queued until the next
// call to `on_writable()`. The owner is expected to poll the file descriptor
// for `poll_events()`. While too many bytes are waiting to be sent, reading
// is suspended, so a peer that does not read cannot make the queue grow
// without bound.
class Socket_Stream
  :
    public Abstract_Stream
  {
  private:
    unique_posix_fd m_fd;
    atomic_relaxed<Socket_State> m_state;
    atomic_relaxed<bool> m_throttled;
    size_t m_throttle_size = 1048576;

    mutable recursive_mutex m_io_mutex;
    linear_buffer m_write_queue;

  public:
    // Takes ownership of a connected socket. The throttle size is read from
    // `network.poll.throttle_size`.
    explicit
    Socket_Stream(unique_posix_fd&& fd);

  private:
    bool
    do_test_change(Socket_State from, Socket_State to) noexcept
      {
        Socket_State old = this->m_state.load();
        return (old == from) && this->m_state.cmpxchg(old, to);
      }

  public:
    Socket_Stream(const Socket_Stream&) = delete;
    Socket_Stream& operator=(const Socket_Stream&) & = delete;
    virtual ~Socket_Stream();

    int
    fd() const noexcept
      { return this->m_fd.get();  }

    Socket_State
    socket_state() const noexcept
      { return this->m_state.load();  }

    bool
    throttled() const noexcept
      { return this->m_throttled.load();  }

    // Get and set the number of pending bytes, above which reading is
    // suspended.
    size_t
    throttle_size() const noexcept
      { return this->m_throttle_size;  }

    void
    set_throttle_size(size_t value) noexcept
      { this->m_throttle_size = value;  }

    // Gets the number of bytes that are waiting to be sent.
    size_t
    pending_size() const noexcept;

    // Gets the events to poll for.
    short
    poll_events() const noexcept;

    // Receives all available data and appends them to `data`. `eof` is set if
    // the peer has shut the connection down. If an error occurs, the socket
    // is shut down, and `false` is returned with `errno` set.
    bool
    on_readable(linear_buffer& data, bool& eof);

    // Sends queued data. If the socket has been requested to close, it is shut
    // down after the queue becomes empty. If an error occurs, the socket is
    // shut down, and `false` is returned with `errno` set.
    bool
    on_writable();

    // Shuts the socket down without flushing queued data.
    // This function is thread-safe.
    bool
    quick_shut_down() noexcept;

    virtual
    bool
    stream_send(chars_view data) override;

    virtual
    void
    stream_throttle(bool throttle) override;

    virtual
    bool
    stream_shut_down() noexcept override;
  };

}  // namespace triton
#endif
