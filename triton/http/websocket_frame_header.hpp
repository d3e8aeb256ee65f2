// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_WEBSOCKET_FRAME_HEADER_
#define TRITON_HTTP_WEBSOCKET_FRAME_HEADER_

#include "../fwd.hpp"
#include "enums.hpp"
namespace triton {

struct WebSocket_Frame_Header
  {
    // The payload length is always stored as an `uint64_t`. The `encode()`
    // function will deduce the correct field basing on its value.
    // Reference: https://datatracker.ietf.org/doc/html/rfc6455#section-5.2
    uint8_t opcode : 4;
    uint8_t rsv3 : 1;
    uint8_t rsv2 : 1;
    uint8_t rsv1 : 1;
    uint8_t fin : 1;
    uint8_t masked : 1;
    uint32_t masking_key;
    uint64_t payload_len;

    WebSocket_Frame_Header() noexcept
      {
        this->clear();
      }

    // Clears all fields.
    void
    clear() noexcept
      {
        this->opcode = 0;
        this->rsv3 = 0;
        this->rsv2 = 0;
        this->rsv1 = 0;
        this->fin = 0;
        this->masked = 0;
        this->masking_key = 0;
        this->payload_len = 0;
      }

    // Gets the number of bytes that `encode()` will write.
    size_t
    encoded_size() const noexcept;

    // Encodes this frame header in wire format. The output will be suitable
    // for sending through a stream socket.
    void
    encode(tinyfmt& fmt) const;

    // Masks a part (or unmasks a masked part) of the frame payload, and update
    // `masking_key` incrementally. If `masked` is unset, this function does
    // nothing.
    void
    mask_payload(char* data, size_t size) noexcept;
  };

}  // namespace triton
#endif
