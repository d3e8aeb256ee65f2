// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_ENUMS_
#define TRITON_HTTP_ENUMS_

#include "../fwd.hpp"
namespace triton {

// Methods are stored as zero-padded strings in big-endian order.
enum HTTP_Method : uint64_t
  {
    http_NULL      = ROCKET_BETOH64(0x0000000000000000),
    http_OPTIONS   = ROCKET_BETOH64(0x4F5054494F4E5300),
    http_GET       = ROCKET_BETOH64(0x4745540000000000),
    http_HEAD      = ROCKET_BETOH64(0x4845414400000000),
    http_POST      = ROCKET_BETOH64(0x504F535400000000),
    http_PUT       = ROCKET_BETOH64(0x5055540000000000),
    http_DELETE    = ROCKET_BETOH64(0x44454C4554450000),
    http_TRACE     = ROCKET_BETOH64(0x5452414345000000),
    http_CONNECT   = ROCKET_BETOH64(0x434F4E4E45435400),
    http_PATCH     = ROCKET_BETOH64(0x5041544348000000),
  };

enum HTTP_Status : uint16_t
  {
    http_status_null                             =   0,
    http_status_switching_protocols              = 101,
    http_status_ok                               = 200,
    http_status_no_content                       = 204,
    http_status_bad_request                      = 400,
    http_status_forbidden                        = 403,
    http_status_not_found                        = 404,
    http_status_method_not_allowed               = 405,
    http_status_request_timeout                  = 408,
    http_status_length_required                  = 411,
    http_status_payload_too_large                = 413,
    http_status_upgrade_required                 = 426,
    http_status_internal_server_error            = 500,
    http_status_http_version_not_supported       = 505,
  };

// Reference: https://datatracker.ietf.org/doc/html/rfc6455#section-5.2
// Values 3-7 and 11-15 are reserved and are never valid on the wire.
enum WS_Opcode : uint8_t
  {
    ws_CONTINUATION  =  0,
    ws_TEXT          =  1,
    ws_BINARY        =  2,
    ws_CLOSE         =  8,
    ws_PING          =  9,
    ws_PONG          = 10,
  };

// Reference: https://datatracker.ietf.org/doc/html/rfc6455#section-7.4.1
// Codes outside this list are carried as raw numbers.
enum WS_Status : uint16_t
  {
    ws_status_null                  =    0,
    ws_status_normal                = 1000,
    ws_status_going_away            = 1001,
    ws_status_protocol_error        = 1002,
    ws_status_not_acceptable        = 1003,
    ws_status_reserved              = 1004,
    ws_status_no_status_code        = 1005,
    ws_status_no_close_frame        = 1006,
    ws_status_message_data_error    = 1007,
    ws_status_policy_violation      = 1008,
    ws_status_message_too_large     = 1009,
    ws_status_extension_required    = 1010,
    ws_status_unexpected_error      = 1011,
    ws_status_service_restart       = 1012,
    ws_status_try_again_later       = 1013,
    ws_status_bad_gateway           = 1014,
    ws_status_tls_error             = 1015,
  };

// A server receives masked frames and sends unmasked ones. A client does the
// opposite.
enum WS_Role : uint8_t
  {
    ws_role_server  = 0,
    ws_role_client  = 1,
  };

enum WS_Status_Class : uint8_t
  {
    ws_status_class_known      = 0,  // 1000-1015, named above
    ws_status_class_reserved   = 1,  // 0-999, 1016-2999, 5000-65535
    ws_status_class_other      = 2,  // 3000-4999, for libraries and applications
  };

// Marks a fragment of a data message, when fragments are delivered as they
// arrive instead of being assembled.
enum WS_Fragment : uint8_t
  {
    ws_fragment_first_text    = 0,
    ws_fragment_first_binary  = 1,
    ws_fragment_continue      = 2,
    ws_fragment_last          = 3,
  };

constexpr
bool
is_websocket_control_opcode(uint32_t opcode) noexcept
  { return (opcode & 8U) != 0;  }

constexpr
bool
is_websocket_known_opcode(uint32_t opcode) noexcept
  { return (opcode <= 2U) || ((opcode >= 8U) && (opcode <= 10U));  }

constexpr
WS_Status_Class
classify_websocket_status(uint32_t status) noexcept
  {
    return ((status >= 1000) && (status <= 1015)) ? ws_status_class_known
           : ((status >= 3000) && (status <= 4999)) ? ws_status_class_other
           : ws_status_class_reserved;
  }

// Checks whether a status code may appear in a CLOSE frame. `1004`, `1005`,
// `1006` and `1015` are known but are for local reporting only.
constexpr
bool
is_websocket_status_sendable(uint32_t status) noexcept
  {
    return (classify_websocket_status(status) == ws_status_class_other)
           || ((classify_websocket_status(status) == ws_status_class_known)
               && (status != 1004) && (status != 1005) && (status != 1006)
               && (status != 1015));
  }

}  // namespace triton
#endif
