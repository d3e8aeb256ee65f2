// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_WEBSOCKET_ERROR_
#define TRITON_HTTP_WEBSOCKET_ERROR_

#include "../fwd.hpp"
#include "enums.hpp"
namespace triton {

// These are violations of the framing protocol. Any of them is fatal to the
// connection on which it occurs.
enum WS_Error : uint8_t
  {
    ws_error_none                      =  0,
    ws_error_unmasked_frame            =  1,  // a server received an unmasked frame
    ws_error_masked_frame              =  2,  // a client received a masked frame
    ws_error_invalid_opcode            =  3,  // datum: opcode
    ws_error_invalid_length            =  4,  // datum: length
    ws_error_bad_opcode                =  5,
    ws_error_overflow                  =  6,
    ws_error_continuation_not_started  =  7,
    ws_error_continuation_started      =  8,
    ws_error_continuation_fragment     =  9,  // datum: opcode
    ws_error_reserved_bits             = 10,  // datum: RSV bits
    ws_error_invalid_utf8              = 11,
    ws_error_io                        = 12,  // datum: `errno`
  };

class WebSocket_Error
  {
  private:
    WS_Error m_code = ws_error_none;
    uint64_t m_datum = 0;

  public:
    constexpr
    WebSocket_Error() noexcept = default;

    constexpr
    WebSocket_Error(WS_Error code, uint64_t datum = 0) noexcept
      :
        m_code(code), m_datum(datum)
      { }

  public:
    constexpr
    WS_Error
    code() const noexcept
      { return this->m_code;  }

    constexpr
    uint64_t
    datum() const noexcept
      { return this->m_datum;  }

    explicit constexpr
    operator bool() const noexcept
      { return this->m_code != ws_error_none;  }

    // Gets the status code to send in a CLOSE frame. Transport errors map to
    // `ws_status_no_close_frame`, which is never sent.
    ROCKET_PURE
    WS_Status
    close_status() const noexcept;

    // Writes a human-readable description.
    tinyfmt&
    describe(tinyfmt& fmt) const;

    cow_string
    to_string() const;
  };

constexpr
bool
operator==(const WebSocket_Error& lhs, const WebSocket_Error& rhs) noexcept
  { return (lhs.code() == rhs.code()) && (lhs.datum() == rhs.datum());  }

constexpr
bool
operator!=(const WebSocket_Error& lhs, const WebSocket_Error& rhs) noexcept
  { return (lhs.code() != rhs.code()) || (lhs.datum() != rhs.datum());  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const WebSocket_Error& err)
  { return err.describe(fmt);  }

}  // namespace triton
#endif
