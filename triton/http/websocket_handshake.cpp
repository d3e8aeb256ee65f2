// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "websocket_handshake.hpp"
#include "../utils.hpp"
#define OPENSSL_API_COMPAT  0x10100000L
#include <openssl/sha.h>
#include <openssl/evp.h>
namespace triton {

const char*
describe_websocket_handshake_error(WS_Handshake_Error err) noexcept
  {
    switch(err)
      {
      case ws_handshake_ok:
        return "Switching Protocols";

      case ws_handshake_get_method_required:
        return "Method Not Allowed";

      case ws_handshake_no_websocket_upgrade:
        return "No WebSocket Upgrade header found";

      case ws_handshake_no_connection_upgrade:
        return "No Connection upgrade";

      case ws_handshake_no_version_header:
        return "WebSocket version header is required";

      case ws_handshake_unsupported_version:
        return "Unsupported WebSocket version";

      case ws_handshake_bad_status:
        return "Unexpected response status";

      case ws_handshake_bad_websocket_accept:
        return "WebSocket accept key mismatch";

      case ws_handshake_bad_websocket_key:
        return "Handshake error";

      default:
        return "Unknown WebSocket handshake error";
      }
  }

cow_string
make_websocket_accept(chars_view key)
  {
    ::SHA_CTX ctx;
    ::SHA1_Init(&ctx);
    ::SHA1_Update(&ctx, key.p, key.n);
    ::SHA1_Update(&ctx, "258EAFA5-E914-47DA-95CA-C5AB0DC85B11", 36);
    unsigned char checksum[20];
    ::SHA1_Final(checksum, &ctx);

    char accept_str[29];  // ceil(20 / 3) * 4 + 1
    ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(accept_str), checksum, 20);
    return cow_string(accept_str, 28);
  }

WS_Handshake_Error
verify_websocket_handshake(const HTTP_Request_Headers& req)
  {
    if(req.method != http_GET)
      return ws_handshake_get_method_required;

    // Upgrade: websocket
    auto value = req.find_header(sref("Upgrade"));
    if(!value || !ascii_ci_contains(*value, sref("websocket")))
      return ws_handshake_no_websocket_upgrade;

    // Connection: Upgrade
    value = req.find_header(sref("Connection"));
    if(!value || !ascii_ci_contains(*value, sref("upgrade")))
      return ws_handshake_no_connection_upgrade;

    // Sec-WebSocket-Version: 13
    value = req.find_header(sref("Sec-WebSocket-Version"));
    if(!value)
      return ws_handshake_no_version_header;

    chars_view version = *value;
    if((version != "13") && (version != "8") && (version != "7"))
      return ws_handshake_unsupported_version;

    // Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==
    value = req.find_header(sref("Sec-WebSocket-Key"));
    if(!value)
      return ws_handshake_bad_websocket_key;

    return ws_handshake_ok;
  }

void
make_websocket_handshake_response(HTTP_Response_Headers& resp, const HTTP_Request_Headers& req)
  {
    auto key = req.find_header(sref("Sec-WebSocket-Key"));
    if(!key)
      TRITON_THROW(("No `Sec-WebSocket-Key` in request to `$1`"), req.uri);

    resp.clear();
    resp.status = http_status_switching_protocols;
    resp.headers.reserve(8);
    resp.headers.emplace_back(sref("Upgrade"), sref("websocket"));
    resp.headers.emplace_back(sref("Connection"), sref("Upgrade"));
    resp.headers.emplace_back(sref("Sec-WebSocket-Accept"), make_websocket_accept(*key));
  }

void
make_websocket_handshake_error_response(HTTP_Response_Headers& resp, WS_Handshake_Error err)
  {
    resp.clear();
    resp.headers.reserve(4);

    if(err == ws_handshake_get_method_required) {
      resp.status = http_status_method_not_allowed;
      resp.headers.emplace_back(sref("Allow"), sref("GET"));
    }
    else {
      resp.status = http_status_bad_request;
      resp.reason = sref(describe_websocket_handshake_error(err));
    }

    resp.headers.emplace_back(sref("Connection"), sref("close"));
    resp.headers.emplace_back(sref("Content-Length"), sref("0"));
  }

WS_Handshake_Error
accept_websocket_handshake(HTTP_Response_Headers& resp, const HTTP_Request_Headers& req)
  {
    auto err = verify_websocket_handshake(req);
    if(err != ws_handshake_ok) {
      TRITON_LOG_ERROR((
          "WebSocket handshake request to `$1` rejected: $2"),
          req.uri, describe_websocket_handshake_error(err));

      make_websocket_handshake_error_response(resp, err);
      return err;
    }

    make_websocket_handshake_response(resp, req);
    TRITON_LOG_DEBUG(("WebSocket handshake request to `$1` accepted"), req.uri);
    return ws_handshake_ok;
  }

void
create_websocket_handshake_request(HTTP_Request_Headers& req, cow_string& key, chars_view uri)
  {
    // The key is a random 16-byte nonce in base64.
    unsigned char nonce[16];
    random_bytes(nonce, sizeof(nonce));
    char key_str[25];  // ceil(16 / 3) * 4 + 1
    ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(key_str), nonce, 16);
    key.assign(key_str, 24);

    req.clear();
    req.method = http_GET;
    req.uri.assign(uri.p, uri.n);
    req.headers.reserve(8);
    req.headers.emplace_back(sref("Connection"), sref("Upgrade"));
    req.headers.emplace_back(sref("Upgrade"), sref("websocket"));
    req.headers.emplace_back(sref("Sec-WebSocket-Version"), sref("13"));
    req.headers.emplace_back(sref("Sec-WebSocket-Key"), key);
  }

WS_Handshake_Error
verify_websocket_handshake_response(const HTTP_Response_Headers& resp, chars_view key)
  {
    if(resp.status != http_status_switching_protocols)
      return ws_handshake_bad_status;

    auto value = resp.find_header(sref("Upgrade"));
    if(!value || !ascii_ci_contains(*value, sref("websocket")))
      return ws_handshake_no_websocket_upgrade;

    value = resp.find_header(sref("Connection"));
    if(!value || !ascii_ci_contains(*value, sref("upgrade")))
      return ws_handshake_no_connection_upgrade;

    value = resp.find_header(sref("Sec-WebSocket-Accept"));
    if(!value || (*value != make_websocket_accept(key)))
      return ws_handshake_bad_websocket_accept;

    return ws_handshake_ok;
  }

}  // namespace triton
