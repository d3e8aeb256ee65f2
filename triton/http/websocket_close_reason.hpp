// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_WEBSOCKET_CLOSE_REASON_
#define TRITON_HTTP_WEBSOCKET_CLOSE_REASON_

#include "../fwd.hpp"
#include "enums.hpp"
#include "websocket_error.hpp"
namespace triton {

// This is the payload of a CLOSE frame. `code` may hold any 16-bit value;
// codes without a name are carried as-is.
struct WebSocket_Close_Reason
  {
    WS_Status code = ws_status_normal;
    opt<cow_string> description;

    WebSocket_Close_Reason() noexcept = default;

    explicit
    WebSocket_Close_Reason(WS_Status xcode) noexcept
      :
        code(xcode)
      { }

    WebSocket_Close_Reason(WS_Status xcode, const cow_string& xdesc)
      :
        code(xcode), description(xdesc)
      { }

    // Parses the payload of a CLOSE frame. An empty payload yields no reason. A
    // payload of one byte is a protocol error. The description must be valid
    // UTF-8.
    static
    WebSocket_Error
    parse(opt<WebSocket_Close_Reason>& reason, chars_view payload);

    // Encodes this reason as the payload of a CLOSE frame. The description is
    // truncated to 123 bytes, at a character boundary.
    void
    encode(tinyfmt& fmt) const;
  };

inline
bool
operator==(const WebSocket_Close_Reason& lhs, const WebSocket_Close_Reason& rhs) noexcept
  {
    return (lhs.code == rhs.code)
           && (lhs.description.has_value() == rhs.description.has_value())
           && (!lhs.description || (*(lhs.description) == *(rhs.description)));
  }

}  // namespace triton
#endif
