// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "websocket_frame_parser.hpp"
#include "websocket_frame_header.hpp"
#include "websocket_mask.hpp"
#include "../base/config_file.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
namespace triton {

void
encode_websocket_frame(tinyfmt& fmt, WS_Opcode opcode, bool fin, opt<uint32_t> masking_key,
                       chars_view payload)
  {
    WebSocket_Frame_Header header;
    header.fin = fin & 1;
    header.opcode = opcode & 15;
    header.payload_len = payload.n;
    if(masking_key) {
      header.masked = 1;
      header.masking_key = *masking_key;
    }
    header.encode(fmt);

    if(!header.masked) {
      fmt.putn(payload.p, payload.n);
      return;
    }

    // Mask the payload in chunks, so the source is not modified.
    char chunk[1024];
    while(payload.n != 0) {
      size_t nchunk = min(payload.n, sizeof(chunk));
      ::memcpy(chunk, payload.p, nchunk);
      header.mask_payload(chunk, nchunk);
      fmt.putn(chunk, nchunk);
      payload >>= nchunk;
    }
  }

void
WebSocket_Frame::
encode(tinyfmt& fmt) const
  {
    encode_websocket_frame(fmt, this->opcode, this->fin, this->masking_key, this->payload);
  }

WebSocket_Frame_Parser::
WebSocket_Frame_Parser(WS_Role role)
  :
    m_role(role)
  {
    const auto conf_file = main_config.copy();
    this->m_max_frame_length = static_cast<uint64_t>(
        conf_file.get_integer_opt(sref("network.websocket.max_frame_length"),
                                  0x100, 0x40000000).value_or(16777216));
  }

WebSocket_Frame_Parser::
~WebSocket_Frame_Parser()
  {
  }

WebSocket_Error
WebSocket_Frame_Parser::
parse_frame_from_stream(opt<WebSocket_Frame>& frame, linear_buffer& data)
  {
    frame.reset();
    if(this->m_error)
      return this->m_error;

    // Calculate the length of this header.
    const uint8_t* bptr = reinterpret_cast<const uint8_t*>(data.data());
    size_t ntotal = 2;
    if(data.size() < ntotal)
      return ws_error_none;

    // Parse the first two bytes, which contain information about other fields.
    WebSocket_Frame_Header header;
    header.fin = bptr[0] >> 7 & 1;
    header.rsv1 = bptr[0] >> 6 & 1;
    header.rsv2 = bptr[0] >> 5 & 1;
    header.rsv3 = bptr[0] >> 4 & 1;
    header.opcode = bptr[0] & 15;
    header.masked = bptr[1] >> 7 & 1;
    uint32_t len7 = bptr[1] & 127U;

    // No extension is negotiated, so all RSV bits must be zero.
    uint32_t rsv = bptr[0] >> 4 & 7U;
    if(rsv != 0)
      return this->m_error = WebSocket_Error(ws_error_reserved_bits, rsv);

    if(!is_websocket_known_opcode(header.opcode))
      return this->m_error = WebSocket_Error(ws_error_invalid_opcode, header.opcode);

    // RFC 6455 states that clients must mask all frames, and servers must not
    // mask any frame.
    if((this->m_role == ws_role_server) && !header.masked)
      return this->m_error = ws_error_unmasked_frame;

    if((this->m_role == ws_role_client) && header.masked)
      return this->m_error = ws_error_masked_frame;

    if(len7 <= 125) {
      // one-byte length
      header.payload_len = len7;
    }
    else if(len7 == 126) {
      // two-byte length
      ntotal += 2;
      if(data.size() < ntotal)
        return ws_error_none;

      uint16_t belen;
      ::memcpy(&belen, bptr + ntotal - 2, 2);
      header.payload_len = ROCKET_BETOH16(belen);
    }
    else {
      // eight-byte length
      ntotal += 8;
      if(data.size() < ntotal)
        return ws_error_none;

      uint64_t belen;
      ::memcpy(&belen, bptr + ntotal - 8, 8);
      header.payload_len = ROCKET_BETOH64(belen);

      // The most significant bit must be zero.
      if(header.payload_len >> 63)
        return this->m_error = WebSocket_Error(ws_error_invalid_length, header.payload_len);
    }

    // RFC 6455
    // 5.5. Control Frames
    // All control frames MUST have a payload length of 125 bytes or less and
    // MUST NOT be fragmented.
    if(is_websocket_control_opcode(header.opcode) && (!header.fin || (header.payload_len > 125)))
      return this->m_error = WebSocket_Error(ws_error_invalid_length, header.payload_len);

    // Reject a frame that is too large before receiving its payload.
    if(header.payload_len > this->m_max_frame_length)
      return this->m_error = WebSocket_Error(ws_error_overflow, header.payload_len);

    if(header.masked) {
      // four-byte masking key
      ntotal += 4;
      if(data.size() < ntotal)
        return ws_error_none;

      uint32_t bekey;
      ::memcpy(&bekey, bptr + ntotal - 4, 4);
      header.masking_key = ROCKET_BETOH32(bekey);
    }

    if(data.size() - ntotal < header.payload_len)
      return ws_error_none;

    // The frame is complete, so remove it from `data`.
    auto& frm = frame.emplace();
    frm.fin = header.fin;
    frm.opcode = static_cast<WS_Opcode>(header.opcode);
    if(header.masked)
      frm.masking_key = header.masking_key;

    size_t len = static_cast<size_t>(header.payload_len);
    frm.payload.append(data.data() + ntotal, len);
    data.discard(ntotal + len);
    header.mask_payload(frm.payload.mut_data(), len);

    TRITON_LOG_TRACE((
        "WebSocket frame received: fin = $1, opcode = $2, masked = $3, length = $4"),
        frm.fin, static_cast<uint32_t>(frm.opcode), header.masked != 0, len);

    return ws_error_none;
  }

}  // namespace triton
