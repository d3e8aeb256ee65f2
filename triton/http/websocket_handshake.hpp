// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_WEBSOCKET_HANDSHAKE_
#define TRITON_HTTP_WEBSOCKET_HANDSHAKE_

#include "../fwd.hpp"
#include "http_request_headers.hpp"
#include "http_response_headers.hpp"
namespace triton {

// These are reasons why an HTTP connection cannot be upgraded. None of them
// is fatal to the connection; the peer gets an ordinary HTTP response.
enum WS_Handshake_Error : uint8_t
  {
    ws_handshake_ok                     = 0,
    ws_handshake_get_method_required    = 1,
    ws_handshake_no_websocket_upgrade   = 2,
    ws_handshake_no_connection_upgrade  = 3,
    ws_handshake_no_version_header      = 4,
    ws_handshake_unsupported_version    = 5,
    ws_handshake_bad_websocket_key      = 6,

    // client side
    ws_handshake_bad_status             = 7,
    ws_handshake_bad_websocket_accept   = 8,
  };

// Gets a reason phrase for an error, which is also suitable for logging.
ROCKET_CONST
const char*
describe_websocket_handshake_error(WS_Handshake_Error err) noexcept;

// Calculates the value of `Sec-WebSocket-Accept` for a key, which is the
// base64 encoding of the SHA-1 digest of the key and a fixed GUID.
// Reference: https://datatracker.ietf.org/doc/html/rfc6455#section-4.2.2
cow_string
make_websocket_accept(chars_view key);

// Checks whether a request from a client may be upgraded to WebSocket. This
// function stops at the first failure. The `Connection` header only has to
// contain `upgrade` somewhere.
WS_Handshake_Error
verify_websocket_handshake(const HTTP_Request_Headers& req);

// Composes a `101 Switching Protocols` response for a request which has been
// verified. The caller may append more headers before sending it.
void
make_websocket_handshake_response(HTTP_Response_Headers& resp, const HTTP_Request_Headers& req);

// Composes an error response. `ws_handshake_get_method_required` results in
// `405 Method Not Allowed` with `Allow: GET`, and all others result in
// `400 Bad Request` with a descriptive reason phrase.
void
make_websocket_handshake_error_response(HTTP_Response_Headers& resp, WS_Handshake_Error err);

// Verifies a request and composes either a `101` response or an error
// response. Errors are also logged.
WS_Handshake_Error
accept_websocket_handshake(HTTP_Response_Headers& resp, const HTTP_Request_Headers& req);

// Composes a handshake request with a new random key, which is also stored
// into `key` for verification of the response. The caller may append more
// headers before sending it.
void
create_websocket_handshake_request(HTTP_Request_Headers& req, cow_string& key,
                                   chars_view uri = "/");

// Checks a response from a server against the key in the request.
WS_Handshake_Error
verify_websocket_handshake_response(const HTTP_Response_Headers& resp, chars_view key);

}  // namespace triton
#endif
