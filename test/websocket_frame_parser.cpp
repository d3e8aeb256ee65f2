// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../triton/http/websocket_frame_parser.hpp"
using namespace ::triton;

namespace {

linear_buffer
make_buffer(const char* data, size_t size)
  {
    linear_buffer buf;
    buf.putn(data, size);
    return buf;
  }

WebSocket_Error
parse_one(WS_Role role, const char* data, size_t size, uint64_t max_frame_length = 1000000)
  {
    WebSocket_Frame_Parser parser(role, max_frame_length);
    auto buf = make_buffer(data, size);
    opt<WebSocket_Frame> frame;
    return parser.parse_frame_from_stream(frame, buf);
  }

}  // namespace

int
main()
  {
    // A single-frame masked text message, received by a server
    WebSocket_Frame_Parser server(ws_role_server, 1000000);
    TRITON_TEST_CHECK(server.role() == ws_role_server);

    auto buf = make_buffer("\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58" "\x89", 12);
    opt<WebSocket_Frame> frame;
    TRITON_TEST_CHECK(!server.parse_frame_from_stream(frame, buf));
    TRITON_TEST_CHECK(frame);
    TRITON_TEST_CHECK(frame->fin);
    TRITON_TEST_CHECK(frame->opcode == ws_TEXT);
    TRITON_TEST_CHECK(frame->masking_key.value_or(0) == 0x37fa213d);
    TRITON_TEST_CHECK(frame->payload == "Hello");
    TRITON_TEST_CHECK(buf.size() == 1);  // next frame left intact

    // Incomplete frames consume nothing.
    static constexpr char ping[] = "\x89\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58";
    buf.clear();
    for(size_t k = 0;  k < 10;  ++k) {
      buf.putc(ping[k]);
      TRITON_TEST_CHECK(!server.parse_frame_from_stream(frame, buf));
      TRITON_TEST_CHECK(!frame);
      TRITON_TEST_CHECK(buf.size() == k + 1);
    }

    buf.putc(ping[10]);
    TRITON_TEST_CHECK(!server.parse_frame_from_stream(frame, buf));
    TRITON_TEST_CHECK(frame);
    TRITON_TEST_CHECK(frame->opcode == ws_PING);
    TRITON_TEST_CHECK(frame->payload == "Hello");
    TRITON_TEST_CHECK(buf.empty());

    // A fragmented unmasked text message, received by a client
    WebSocket_Frame_Parser client(ws_role_client, 1000000);
    buf = make_buffer("\x01\x03\x48\x65\x6c" "\x80\x02\x6c\x6f", 9);
    TRITON_TEST_CHECK(!client.parse_frame_from_stream(frame, buf));
    TRITON_TEST_CHECK(frame);
    TRITON_TEST_CHECK(!frame->fin);
    TRITON_TEST_CHECK(frame->opcode == ws_TEXT);
    TRITON_TEST_CHECK(!frame->masking_key);
    TRITON_TEST_CHECK(frame->payload == "Hel");
    TRITON_TEST_CHECK(!client.parse_frame_from_stream(frame, buf));
    TRITON_TEST_CHECK(frame);
    TRITON_TEST_CHECK(frame->fin);
    TRITON_TEST_CHECK(frame->opcode == ws_CONTINUATION);
    TRITON_TEST_CHECK(frame->payload == "lo");
    TRITON_TEST_CHECK(buf.empty());

    // 16-bit and 64-bit lengths
    for(size_t len : { 0U, 125U, 126U, 65535U, 65536U, 70000U }) {
      cow_string payload;
      payload.append(len, 'x');

      tinyfmt_str fmt;
      encode_websocket_frame(fmt, ws_BINARY, true, 0x12345678U, payload);
      buf = make_buffer(fmt.data(), fmt.size());
      TRITON_TEST_CHECK(!server.parse_frame_from_stream(frame, buf));
      TRITON_TEST_CHECK(frame);
      TRITON_TEST_CHECK(frame->opcode == ws_BINARY);
      TRITON_TEST_CHECK(frame->payload == payload);
      TRITON_TEST_CHECK(buf.empty());
    }

    // Every opcode and `fin` flag survives encoding, masked and unmasked. Data
    // frames use all three length classes; control frames are short.
    static constexpr WS_Opcode opcodes[] = { ws_CONTINUATION, ws_TEXT, ws_BINARY, ws_CLOSE, ws_PING, ws_PONG };
    for(auto opcode : opcodes)
      for(bool fin : { false, true })
        for(size_t len : { 0U, 2U, 125U, 126U, 65535U, 65536U })
          for(bool masked : { false, true }) {
            bool control = opcode >= ws_CLOSE;
            if(control && (!fin || (len > 125)))
              continue;

            cow_string payload;
            payload.append(len, 'y');

            opt<uint32_t> masking_key;
            if(masked)
              masking_key = 0xA1B2C3D4U;

            tinyfmt_str fmt;
            encode_websocket_frame(fmt, opcode, fin, masking_key, payload);
            buf = make_buffer(fmt.data(), fmt.size());
            WebSocket_Frame_Parser& parser = masked ? server : client;
            TRITON_TEST_CHECK(!parser.parse_frame_from_stream(frame, buf));
            TRITON_TEST_CHECK(frame);
            TRITON_TEST_CHECK(frame->fin == fin);
            TRITON_TEST_CHECK(frame->opcode == opcode);
            TRITON_TEST_CHECK(frame->masking_key.value_or(0) == masking_key.value_or(0));
            TRITON_TEST_CHECK(frame->payload == payload);
            TRITON_TEST_CHECK(buf.empty());
          }

    // Role violations
    TRITON_TEST_CHECK(parse_one(ws_role_server, "\x81\x05Hello", 7) == ws_error_unmasked_frame);
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58", 11)
                      == ws_error_masked_frame);

    // Reserved opcodes
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x83\x00", 2) == WebSocket_Error(ws_error_invalid_opcode, 3));
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x8B\x00", 2) == WebSocket_Error(ws_error_invalid_opcode, 11));
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x8F\x00", 2) == WebSocket_Error(ws_error_invalid_opcode, 15));

    // RSV bits without extensions
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\xC1\x00", 2) == WebSocket_Error(ws_error_reserved_bits, 4));

    // Control frames
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x09\x00", 2) == WebSocket_Error(ws_error_invalid_length, 0));
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x89\x7E\x00\x7E", 4)
                      == WebSocket_Error(ws_error_invalid_length, 126));
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x88\x7E\x00\x7E", 4).code() == ws_error_invalid_length);

    // The most significant bit of a 64-bit length must be zero.
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x82\x7F\x80\x00\x00\x00\x00\x00\x00\x01", 10).code()
                      == ws_error_invalid_length);

    // The length limit is checked before the payload arrives.
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x82\x7E\x01\x01", 4, 256)
                      == WebSocket_Error(ws_error_overflow, 257));
    TRITON_TEST_CHECK(parse_one(ws_role_client, "\x82\x7E\x01\x00", 4, 256) == ws_error_none);

    // Errors stick.
    WebSocket_Frame_Parser broken(ws_role_server, 1000000);
    buf = make_buffer("\x81\x05Hello", 7);
    TRITON_TEST_CHECK(broken.parse_frame_from_stream(frame, buf) == ws_error_unmasked_frame);
    TRITON_TEST_CHECK(broken.error() == ws_error_unmasked_frame);
    buf = make_buffer("\x89\x80\x00\x00\x00\x00", 6);
    TRITON_TEST_CHECK(broken.parse_frame_from_stream(frame, buf) == ws_error_unmasked_frame);
    TRITON_TEST_CHECK(!frame);
    broken.clear();
    TRITON_TEST_CHECK(!broken.parse_frame_from_stream(frame, buf));
    TRITON_TEST_CHECK(frame);
    TRITON_TEST_CHECK(frame->opcode == ws_PING);
    TRITON_TEST_CHECK(frame->payload.empty());

    // Encoded frames can be parsed back.
    WebSocket_Frame out;
    out.fin = false;
    out.opcode = ws_TEXT;
    out.masking_key = 0xDEADBEEF;
    out.payload = sref("fragment");
    tinyfmt_str fmt;
    out.encode(fmt);
    buf = make_buffer(fmt.data(), fmt.size());
    TRITON_TEST_CHECK(!server.parse_frame_from_stream(frame, buf));
    TRITON_TEST_CHECK(frame);
    TRITON_TEST_CHECK(!frame->fin);
    TRITON_TEST_CHECK(frame->masking_key.value_or(0) == 0xDEADBEEF);
    TRITON_TEST_CHECK(frame->payload == "fragment");
  }
