// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_SOCKET_ABSTRACT_STREAM_
#define TRITON_SOCKET_ABSTRACT_STREAM_

#include "../fwd.hpp"
#include "enums.hpp"
namespace triton {

// This is the byte stream beneath a WebSocket connection. Incoming data are
// not read through this interface; whoever drives the stream pushes them into
// a dispatcher.
class Abstract_Stream
  {
  protected:
    Abstract_Stream() noexcept = default;

  public:
    Abstract_Stream(const Abstract_Stream&) = delete;
    Abstract_Stream& operator=(const Abstract_Stream&) & = delete;
    virtual ~Abstract_Stream();

    // Enqueues data for sending. If the stream has been shut down, `false` is
    // returned and nothing is sent.
    // This function shall be thread-safe.
    virtual
    bool
    stream_send(chars_view data)
      = 0;

    // Suspends or resumes delivery of incoming data, so a slow reader will not
    // cause unbounded buffering.
    // This function shall be thread-safe.
    virtual
    void
    stream_throttle(bool throttle)
      = 0;

    // Shuts the stream down in both directions, once all pending data have
    // been sent. If the stream has already been shut down, `false` is returned.
    // This function shall be thread-safe.
    virtual
    bool
    stream_shut_down() noexcept
      = 0;
  };

}  // namespace triton
#endif
