// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_WEBSOCKET_ASSEMBLER_
#define TRITON_HTTP_WEBSOCKET_ASSEMBLER_

#include "../fwd.hpp"
#include "enums.hpp"
#include "websocket_error.hpp"
#include "websocket_message.hpp"
namespace triton {

// This class reconstructs messages from frames of a single connection.
// Control frames may interleave with fragments of a data message, and are
// delivered immediately.
class WebSocket_Assembler
  {
  private:
    uint64_t m_max_message_length = 1048576;
    bool m_raw_fragments = false;
    bool m_active = false;
    WS_Opcode m_opcode = ws_CONTINUATION;
    cow_string m_buffer;
    WebSocket_Error m_error;

  public:
    // Constructs an assembler. The maximum length of a message is read from
    // `network.websocket.max_message_length`.
    WebSocket_Assembler();

    explicit
    WebSocket_Assembler(uint64_t max_message_length, bool raw_fragments = false) noexcept
      :
        m_max_message_length(max_message_length), m_raw_fragments(raw_fragments)
      { }

  public:
    WebSocket_Assembler(const WebSocket_Assembler&) = delete;
    WebSocket_Assembler& operator=(const WebSocket_Assembler&) & = delete;
    ~WebSocket_Assembler();

    uint64_t
    max_message_length() const noexcept
      { return this->m_max_message_length;  }

    void
    set_max_message_length(uint64_t value) noexcept
      { this->m_max_message_length = value;  }

    // In raw fragment mode, each data frame is delivered as a CONTINUATION
    // message as soon as it arrives. Fragmentation rules are still enforced,
    // and the length limit applies to each frame. UTF-8 is validated for
    // unfragmented text messages only.
    bool
    raw_fragments() const noexcept
      { return this->m_raw_fragments;  }

    void
    set_raw_fragments(bool value) noexcept
      { this->m_raw_fragments = value;  }

    // Is a fragmented message being received?
    bool
    active() const noexcept
      { return this->m_active;  }

    WS_Opcode
    active_opcode() const noexcept
      { return this->m_opcode;  }

    size_t
    buffered_length() const noexcept
      { return this->m_buffer.size();  }

    // Gets the error that stopped this assembler. After an error has occurred,
    // no more frames will be accepted.
    const WebSocket_Error&
    error() const noexcept
      { return this->m_error;  }

    // Discards the current message and clears the error, so the assembler can
    // be reused for another stream.
    void
    clear() noexcept;

    // Releases the message buffer.
    void
    deallocate() noexcept;

    // Accepts a frame. If a message is complete, it is stored into `msg`;
    // otherwise `msg` is set to NOP. Any error sticks.
    WebSocket_Error
    accept_frame(WebSocket_Message& msg, WebSocket_Frame&& frame);
  };

}  // namespace triton
#endif
