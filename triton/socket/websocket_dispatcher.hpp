// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_SOCKET_WEBSOCKET_DISPATCHER_
#define TRITON_SOCKET_WEBSOCKET_DISPATCHER_

#include "../fwd.hpp"
#include "enums.hpp"
#include "abstract_stream.hpp"
#include "../http/enums.hpp"
#include "../http/websocket_error.hpp"
#include "../http/websocket_frame_parser.hpp"
#include "../http/websocket_assembler.hpp"
#include "../http/websocket_message.hpp"
namespace triton {

// This class runs the WebSocket protocol on an upgraded stream. Incoming data
// are pushed in by whoever drives the stream, and complete messages are
// queued for the application. Outgoing messages are encoded and sent in the
// order they are submitted.
// The incoming path and the outgoing path may run on different threads, but
// neither may run concurrently with itself. `check_close_timeout()` and
// `on_stream_closed()` may be called from either side.
class WebSocket_Dispatcher
  {
  public:
    struct Stats
      {
        uint64_t frames_in;
        uint64_t bytes_in;
        uint64_t frames_out;
        uint64_t bytes_out;
      };

  private:
    Abstract_Stream* m_stream;
    WS_Role m_role;
    atomic_acq_rel<WS_Dispatcher_State> m_state;
    bool m_auto_pong = true;
    milliseconds m_close_timeout = milliseconds(5000);
    size_t m_max_inbound_messages = 256;

    // incoming path; the assembler may be released from other threads
    mutable plain_mutex m_inbound_mutex;
    WebSocket_Frame_Parser m_parser;
    WebSocket_Assembler m_assembler;
    atomic_relaxed<uint64_t> m_frames_in;
    atomic_relaxed<uint64_t> m_bytes_in;

    // outgoing path; state changes also happen here
    mutable plain_mutex m_send_mutex;
    steady_time m_close_deadline;
    bool m_out_active = false;
    atomic_relaxed<uint64_t> m_frames_out;
    atomic_relaxed<uint64_t> m_bytes_out;

    // application
    mutable plain_mutex m_queue_mutex;
    deque<WebSocket_Message> m_queue;
    bool m_throttled = false;

  public:
    // Attaches a dispatcher to `stream`, which must outlive it. Limits are
    // read from `network.websocket.*`.
    WebSocket_Dispatcher(Abstract_Stream& stream, WS_Role role);

  private:
    bool
    do_send_frame_nolock(WS_Opcode opcode, bool fin, chars_view payload);

    void
    do_close_nolock(const char* why);

    void
    do_release_inbound() noexcept;

    void
    do_push_message(WebSocket_Message&& msg);

    void
    do_on_close_frame(const opt<WebSocket_Close_Reason>& reason);

    void
    do_fail(const WebSocket_Error& err);

  public:
    WebSocket_Dispatcher(const WebSocket_Dispatcher&) = delete;
    WebSocket_Dispatcher& operator=(const WebSocket_Dispatcher&) & = delete;
    ~WebSocket_Dispatcher();

    WS_Role
    role() const noexcept
      { return this->m_role;  }

    WS_Dispatcher_State
    state() const noexcept
      { return this->m_state.load();  }

    // Get and set configuration values. These shall not be changed after data
    // have been received.
    bool
    auto_pong() const noexcept
      { return this->m_auto_pong;  }

    void
    set_auto_pong(bool value) noexcept
      { this->m_auto_pong = value;  }

    milliseconds
    close_timeout() const noexcept
      { return this->m_close_timeout;  }

    void
    set_close_timeout(milliseconds value) noexcept
      { this->m_close_timeout = value;  }

    size_t
    max_inbound_messages() const noexcept
      { return this->m_max_inbound_messages;  }

    void
    set_max_inbound_messages(size_t value) noexcept
      { this->m_max_inbound_messages = value;  }

    WebSocket_Frame_Parser&
    mut_parser() noexcept
      { return this->m_parser;  }

    WebSocket_Assembler&
    mut_assembler() noexcept
      { return this->m_assembler;  }

    // Gets traffic counters.
    Stats
    stats() const noexcept;

    // Processes incoming data, until a frame is incomplete. Consumed data are
    // removed from `data`. `eof` indicates that the peer has closed the stream.
    // After the connection is closed, all data are discarded.
    void
    on_stream_data(linear_buffer& data, bool eof);

    // Notifies the dispatcher that the stream has been closed. `err` is zero for
    // a normal closure, or an `errno` value otherwise.
    void
    on_stream_closed(int err);

    // Closes the connection if a CLOSE frame has been sent and no reply has
    // arrived before the deadline. Returns whether the connection has been
    // closed by this call.
    bool
    check_close_timeout(steady_time now);

    // Gets the next message for the application. If no message is available,
    // `false` is returned. After the connection has been closed, the final
    // message is a CLOSE.
    bool
    next_message(WebSocket_Message& msg);

    opt<WebSocket_Message>
    next_message();

    // Has the final message been taken?
    bool
    finished() const noexcept;

    // Sends a message. A CLOSE message initiates the closing handshake. Data
    // messages and PING and PONG messages may only be sent while the
    // connection is open. If the connection has been closed, an exception is
    // thrown.
    // Returns whether the stream has accepted the data.
    bool
    send(const WebSocket_Message& msg);

    bool
    send_text(chars_view data);

    bool
    send_binary(chars_view data);

    bool
    ping(chars_view data);

    // Initiates the closing handshake. If the connection is not open, `false`
    // is returned and nothing is sent.
    bool
    shut_down(const opt<WebSocket_Close_Reason>& reason = nullopt);
  };

}  // namespace triton
#endif
