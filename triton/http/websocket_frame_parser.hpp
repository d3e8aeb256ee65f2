// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_WEBSOCKET_FRAME_PARSER_
#define TRITON_HTTP_WEBSOCKET_FRAME_PARSER_

#include "../fwd.hpp"
#include "enums.hpp"
#include "websocket_error.hpp"
namespace triton {

// This is a complete frame. Its payload has been unmasked. `masking_key` is
// the key that was found on the wire, if any.
struct WebSocket_Frame
  {
    bool fin = true;
    WS_Opcode opcode = ws_CONTINUATION;
    opt<uint32_t> masking_key;
    cow_string payload;

    // Encodes this frame. If `masking_key` is set, the payload is masked with
    // it on the wire.
    void
    encode(tinyfmt& fmt) const;
  };

// Encodes a frame into `fmt`. If `masking_key` is set, the payload is masked
// with it. The caller shall not request a fragmented control frame, or a
// control frame whose payload is longer than 125 bytes.
void
encode_websocket_frame(tinyfmt& fmt, WS_Opcode opcode, bool fin, opt<uint32_t> masking_key,
                       chars_view payload);

class WebSocket_Frame_Parser
  {
  private:
    WS_Role m_role;
    uint64_t m_max_frame_length = 16777216;
    WebSocket_Error m_error;

  public:
    // Constructs a parser for frames received by `role`. The maximum length of
    // a frame payload is read from `network.websocket.max_frame_length`.
    explicit
    WebSocket_Frame_Parser(WS_Role role);

    WebSocket_Frame_Parser(WS_Role role, uint64_t max_frame_length) noexcept
      :
        m_role(role), m_max_frame_length(max_frame_length)
      { }

  public:
    WebSocket_Frame_Parser(const WebSocket_Frame_Parser&) = delete;
    WebSocket_Frame_Parser& operator=(const WebSocket_Frame_Parser&) & = delete;
    ~WebSocket_Frame_Parser();

    WS_Role
    role() const noexcept
      { return this->m_role;  }

    uint64_t
    max_frame_length() const noexcept
      { return this->m_max_frame_length;  }

    void
    set_max_frame_length(uint64_t value) noexcept
      { this->m_max_frame_length = value;  }

    // Gets the error that stopped this parser. After an error has occurred, no
    // more data will be accepted.
    const WebSocket_Error&
    error() const noexcept
      { return this->m_error;  }

    // Clears the error, so the parser can be reused for another stream.
    void
    clear() noexcept
      { this->m_error = ws_error_none;  }

    // Parses one frame from the beginning of `data`. If a complete frame has
    // been received, it is removed from `data` and stored into `frame`, and its
    // payload is unmasked. If more data are needed, `frame` is reset and `data`
    // is left intact. Frames that violate the protocol cause an error to be
    // returned, and the error sticks.
    WebSocket_Error
    parse_frame_from_stream(opt<WebSocket_Frame>& frame, linear_buffer& data);
  };

}  // namespace triton
#endif
