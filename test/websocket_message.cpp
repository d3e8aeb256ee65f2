// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../triton/http/websocket_message.hpp"
using namespace ::triton;

int
main()
  {
    WebSocket_Message msg;
    TRITON_TEST_CHECK(msg.is_nop());
    TRITON_TEST_CHECK(msg.kind() == ws_message_nop);
    TRITON_TEST_CHECK(msg.payload().n == 0);

    msg = WebSocket_Message::Text{ sref("hello") };
    TRITON_TEST_CHECK(msg.is_text());
    TRITON_TEST_CHECK(!msg.is_binary());
    TRITON_TEST_CHECK(msg.kind() == ws_message_text);
    TRITON_TEST_CHECK(msg.opcode() == ws_TEXT);
    TRITON_TEST_CHECK(msg.payload() == "hello");
    TRITON_TEST_CHECK(msg.as_text() == "hello");

    msg = WebSocket_Message::Binary{ cow_string("\x00\x01", 2) };
    TRITON_TEST_CHECK(msg.is_binary());
    TRITON_TEST_CHECK(msg.opcode() == ws_BINARY);
    TRITON_TEST_CHECK(msg.payload().n == 2);

    msg = WebSocket_Message::Continuation{ ws_fragment_first_binary, sref("abc") };
    TRITON_TEST_CHECK(msg.is_continuation());
    TRITON_TEST_CHECK(msg.opcode() == ws_BINARY);
    TRITON_TEST_CHECK(msg.as_continuation().fragment == ws_fragment_first_binary);

    msg = WebSocket_Message::Continuation{ ws_fragment_last, sref("xyz") };
    TRITON_TEST_CHECK(msg.opcode() == ws_CONTINUATION);
    TRITON_TEST_CHECK(msg.payload() == "xyz");

    msg = WebSocket_Message::Ping{ sref("p") };
    TRITON_TEST_CHECK(msg.is_ping());
    TRITON_TEST_CHECK(msg.opcode() == ws_PING);

    msg = WebSocket_Message::Pong{ sref("q") };
    TRITON_TEST_CHECK(msg.is_pong());
    TRITON_TEST_CHECK(msg.opcode() == ws_PONG);
    TRITON_TEST_CHECK(msg.as_pong() == "q");

    msg = WebSocket_Message::Close{ nullopt };
    TRITON_TEST_CHECK(msg.is_close());
    TRITON_TEST_CHECK(msg.opcode() == ws_CLOSE);
    TRITON_TEST_CHECK(!msg.as_close());
    TRITON_TEST_CHECK(msg.payload().n == 0);

    msg = WebSocket_Message::Close{ WebSocket_Close_Reason(ws_status_going_away, sref("bye")) };
    TRITON_TEST_CHECK(msg.as_close()->code == ws_status_going_away);
    TRITON_TEST_CHECK(msg.payload() == "bye");

    tinyfmt_str fmt;
    fmt << msg;
    TRITON_TEST_CHECK(fmt.get_string() == "CLOSE 1001: bye");

    WebSocket_Message other = WebSocket_Message::Text{ sref("hi") };
    swap(msg, other);
    TRITON_TEST_CHECK(msg.is_text());
    TRITON_TEST_CHECK(other.is_close());

    fmt.clear_string();
    fmt << msg;
    TRITON_TEST_CHECK(fmt.get_string() == "TEXT (2 bytes)");
  }
