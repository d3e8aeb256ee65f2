// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "websocket_error.hpp"
#include "../utils.hpp"
namespace triton {

WS_Status
WebSocket_Error::
close_status() const noexcept
  {
    switch(this->m_code)
      {
      case ws_error_none:
        return ws_status_normal;

      case ws_error_overflow:
        return ws_status_message_too_large;

      case ws_error_invalid_utf8:
        return ws_status_message_data_error;

      case ws_error_io:
        return ws_status_no_close_frame;

      default:
        return ws_status_protocol_error;
      }
  }

tinyfmt&
WebSocket_Error::
describe(tinyfmt& fmt) const
  {
    switch(this->m_code)
      {
      case ws_error_none:
        return fmt << "No error.";

      case ws_error_unmasked_frame:
        return fmt << "Received an unmasked frame from client.";

      case ws_error_masked_frame:
        return fmt << "Received a masked frame from server.";

      case ws_error_invalid_opcode:
        return format(fmt, "Invalid opcode: $1.", this->m_datum);

      case ws_error_invalid_length:
        return format(fmt, "Invalid control frame length: $1.", this->m_datum);

      case ws_error_bad_opcode:
        return fmt << "Bad opcode.";

      case ws_error_overflow:
        return fmt << "A payload reached size limit.";

      case ws_error_continuation_not_started:
        return fmt << "Continuation has not started.";

      case ws_error_continuation_started:
        return fmt << "Received new continuation but it is already started.";

      case ws_error_continuation_fragment:
        return format(fmt, "Unknown continuation fragment: $1.", this->m_datum);

      case ws_error_reserved_bits:
        return format(fmt, "Reserved bits set without an extension: $1.", this->m_datum);

      case ws_error_invalid_utf8:
        return fmt << "Invalid UTF-8 text payload.";

      case ws_error_io:
        {
          char sbuf[256];
          const char* str = ::strerror_r(static_cast<int>(this->m_datum), sbuf, sizeof(sbuf));
          return format(fmt, "I/O error: $1 (errno $2).", str, this->m_datum);
        }

      default:
        return format(fmt, "Unknown error `$1`.", static_cast<uint32_t>(this->m_code));
      }
  }

cow_string
WebSocket_Error::
to_string() const
  {
    tinyfmt_str fmt;
    this->describe(fmt);
    return fmt.extract_string();
  }

}  // namespace triton
