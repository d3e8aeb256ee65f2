// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "websocket_frame_header.hpp"
#include "websocket_mask.hpp"
#include "../utils.hpp"
namespace triton {

size_t
WebSocket_Frame_Header::
encoded_size() const noexcept
  {
    size_t nlen = (this->payload_len <= 125) ? 0
                  : (this->payload_len <= 0xFFFF) ? 2
                  : 8;
    return 2 + nlen + this->masked * 4U;
  }

void
WebSocket_Frame_Header::
encode(tinyfmt& fmt) const
  {
    // RFC 6455, 5.2. Base Framing Protocol
    // Multi-byte fields are in network byte order.
    static_vector<char, 14> bytes;
    auto put_be = [&](uint64_t value, uint32_t width)
      {
        while(width != 0)
          bytes.push_back(static_cast<char>(value >> (--width * 8)));
      };

    put_be(this->fin * 0x80U | this->rsv1 * 0x40U | this->rsv2 * 0x20U | this->rsv3 * 0x10U
           | this->opcode, 1);

    uint32_t mask_bit = this->masked * 0x80U;
    if(this->payload_len <= 125)
      put_be(mask_bit | this->payload_len, 1);
    else if(this->payload_len <= 0xFFFF) {
      put_be(mask_bit | 126, 1);
      put_be(this->payload_len, 2);
    }
    else {
      put_be(mask_bit | 127, 1);
      put_be(this->payload_len, 8);
    }

    if(this->masked)
      put_be(this->masking_key, 4);

    ROCKET_ASSERT(bytes.size() == this->encoded_size());
    fmt.putn(bytes.data(), bytes.size());
  }

void
WebSocket_Frame_Header::
mask_payload(char* data, size_t size) noexcept
  {
    if(this->masked)
      mask_websocket_payload(data, size, this->masking_key);
  }

}  // namespace triton
