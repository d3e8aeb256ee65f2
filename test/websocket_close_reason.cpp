// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../triton/http/websocket_close_reason.hpp"
using namespace ::triton;

int
main()
  {
    opt<WebSocket_Close_Reason> reason;

    // An empty payload has no reason.
    reason.emplace(ws_status_going_away);
    TRITON_TEST_CHECK(!WebSocket_Close_Reason::parse(reason, ""));
    TRITON_TEST_CHECK(!reason);

    // A status code alone
    TRITON_TEST_CHECK(!WebSocket_Close_Reason::parse(reason, chars_view("\x03\xE8", 2)));
    TRITON_TEST_CHECK(reason);
    TRITON_TEST_CHECK(reason->code == ws_status_normal);
    TRITON_TEST_CHECK(!reason->description);

    // A status code with a description
    TRITON_TEST_CHECK(!WebSocket_Close_Reason::parse(reason, chars_view("\x03\xF1too big", 9)));
    TRITON_TEST_CHECK(reason);
    TRITON_TEST_CHECK(reason->code == ws_status_message_too_large);
    TRITON_TEST_CHECK(*(reason->description) == "too big");

    // Codes without names are carried as-is.
    TRITON_TEST_CHECK(!WebSocket_Close_Reason::parse(reason, chars_view("\x0F\xA0", 2)));
    TRITON_TEST_CHECK(static_cast<uint32_t>(reason->code) == 4000);
    TRITON_TEST_CHECK(classify_websocket_status(reason->code) == ws_status_class_other);
    TRITON_TEST_CHECK(classify_websocket_status(1004) == ws_status_class_known);
    TRITON_TEST_CHECK(classify_websocket_status(2999) == ws_status_class_reserved);
    TRITON_TEST_CHECK(classify_websocket_status(999) == ws_status_class_reserved);
    TRITON_TEST_CHECK(is_websocket_status_sendable(1000));
    TRITON_TEST_CHECK(is_websocket_status_sendable(4999));
    TRITON_TEST_CHECK(!is_websocket_status_sendable(1005));
    TRITON_TEST_CHECK(!is_websocket_status_sendable(1006));
    TRITON_TEST_CHECK(!is_websocket_status_sendable(5000));

    // Errors
    TRITON_TEST_CHECK(WebSocket_Close_Reason::parse(reason, "\x03")
                      == WebSocket_Error(ws_error_invalid_length, 1));
    TRITON_TEST_CHECK(!reason);
    TRITON_TEST_CHECK(WebSocket_Close_Reason::parse(reason, chars_view("\x03\xE8\xFF", 3))
                      == ws_error_invalid_utf8);
    TRITON_TEST_CHECK(!reason);

    // Encoding
    tinyfmt_str fmt;
    WebSocket_Close_Reason(ws_status_going_away).encode(fmt);
    TRITON_TEST_CHECK(fmt.size() == 2);
    TRITON_TEST_CHECK(xmemeq(fmt.data(), "\x03\xE9", 2));

    fmt.clear_string();
    WebSocket_Close_Reason(ws_status_protocol_error, sref("bad frame")).encode(fmt);
    TRITON_TEST_CHECK(fmt.size() == 11);
    TRITON_TEST_CHECK(xmemeq(fmt.data(), "\x03\xEA" "bad frame", 11));

    TRITON_TEST_CHECK(!WebSocket_Close_Reason::parse(reason, fmt));
    TRITON_TEST_CHECK(*reason == WebSocket_Close_Reason(ws_status_protocol_error, sref("bad frame")));

    // Long descriptions are truncated at a character boundary.
    cow_string desc;
    desc.append(122, 'a');
    desc.append("\xE4\xBD\xA0");
    fmt.clear_string();
    WebSocket_Close_Reason(ws_status_normal, desc).encode(fmt);
    TRITON_TEST_CHECK(fmt.size() == 124);
    TRITON_TEST_CHECK(!WebSocket_Close_Reason::parse(reason, fmt));
    TRITON_TEST_CHECK(reason->description->size() == 122);

    desc.clear();
    desc.append(200, 'b');
    fmt.clear_string();
    WebSocket_Close_Reason(ws_status_normal, desc).encode(fmt);
    TRITON_TEST_CHECK(fmt.size() == 125);
  }
