// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../triton/http/websocket_frame_header.hpp"
#include "../triton/http/websocket_frame_parser.hpp"
using namespace ::triton;

int
main()
  {
    // https://datatracker.ietf.org/doc/html/rfc6455#section-5.7
    tinyfmt_str fmt;
    WebSocket_Frame_Header header;

    // A single-frame unmasked text message
    header.fin = 1;
    header.opcode = ws_TEXT;
    header.payload_len = 5;
    TRITON_TEST_CHECK(header.encoded_size() == 2);
    header.encode(fmt);
    fmt.putn("Hello", 5);
    TRITON_TEST_CHECK(fmt.size() == 7);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x81\x05\x48\x65\x6c\x6c\x6f", 7));

    fmt.clear_string();
    encode_websocket_frame(fmt, ws_TEXT, true, nullopt, "Hello");
    TRITON_TEST_CHECK(fmt.size() == 7);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x81\x05\x48\x65\x6c\x6c\x6f", 7));

    // A single-frame masked text message
    fmt.clear_string();
    header.clear();
    header.fin = 1;
    header.opcode = ws_TEXT;
    header.masked = 1;
    header.masking_key = 0x37fa213d;
    header.payload_len = 5;
    TRITON_TEST_CHECK(header.encoded_size() == 6);
    header.encode(fmt);

    char hello[] = "Hello";
    header.mask_payload(hello, 5);
    fmt.putn(hello, 5);
    TRITON_TEST_CHECK(fmt.size() == 11);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58", 11));

    fmt.clear_string();
    encode_websocket_frame(fmt, ws_TEXT, true, 0x37fa213dU, "Hello");
    TRITON_TEST_CHECK(fmt.size() == 11);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58", 11));

    // A fragmented unmasked text message
    fmt.clear_string();
    encode_websocket_frame(fmt, ws_TEXT, false, nullopt, "Hel");
    TRITON_TEST_CHECK(fmt.size() == 5);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x01\x03\x48\x65\x6c", 5));

    fmt.clear_string();
    encode_websocket_frame(fmt, ws_CONTINUATION, true, nullopt, "lo");
    TRITON_TEST_CHECK(fmt.size() == 4);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x80\x02\x6c\x6f", 4));

    // Unmasked Ping request and masked Ping response
    fmt.clear_string();
    encode_websocket_frame(fmt, ws_PING, true, nullopt, "Hello");
    TRITON_TEST_CHECK(fmt.size() == 7);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x89\x05\x48\x65\x6c\x6c\x6f", 7));

    fmt.clear_string();
    encode_websocket_frame(fmt, ws_PONG, true, 0x37fa213dU, "Hello");
    TRITON_TEST_CHECK(fmt.size() == 11);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x8a\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58", 11));

    // 256 bytes binary message in a single unmasked frame
    fmt.clear_string();
    header.clear();
    header.fin = 1;
    header.opcode = ws_BINARY;
    header.payload_len = 256;
    header.encode(fmt);
    TRITON_TEST_CHECK(fmt.size() == 4);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x82\x7E\x01\x00", 4));

    // 64KiB binary message in a single unmasked frame
    fmt.clear_string();
    header.clear();
    header.fin = 1;
    header.opcode = ws_BINARY;
    header.payload_len = 65536;
    header.encode(fmt);
    TRITON_TEST_CHECK(fmt.size() == 10);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x82\x7F\x00\x00\x00\x00\x00\x01\x00\x00", 10));

    // Length boundaries
    fmt.clear_string();
    header.payload_len = 125;
    header.encode(fmt);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x82\x7D", 2));

    fmt.clear_string();
    header.payload_len = 126;
    header.encode(fmt);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x82\x7E\x00\x7E", 4));

    fmt.clear_string();
    header.payload_len = 65535;
    header.encode(fmt);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x82\x7E\xFF\xFF", 4));

    // Masking a long payload in pieces
    char lorem[] = "Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod "
                   "tempor incididunt ut labore et dolore magna aliqua.";
    size_t len = ::strlen(lorem);
    fmt.clear_string();
    encode_websocket_frame(fmt, ws_BINARY, true, 0x37fa213dU, chars_view(lorem, len));
    TRITON_TEST_CHECK(fmt.size() == 2 + 4 + len);
    TRITON_TEST_CHECK(xmemeq(fmt.c_str(), "\x82\xFB\x37\xfa\x21\x3d", 6));

    header.clear();
    header.masked = 1;
    header.masking_key = 0x37fa213d;
    for(size_t off = 0;  off < len;  off += 5)
      header.mask_payload(lorem + off, min(len - off, size_t(5)));
    TRITON_TEST_CHECK(xmemeq(fmt.c_str() + 6, lorem, len));
  }
