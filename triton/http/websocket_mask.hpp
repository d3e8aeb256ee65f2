// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_WEBSOCKET_MASK_
#define TRITON_HTTP_WEBSOCKET_MASK_

#include "../fwd.hpp"
namespace triton {

// Masks (or unmasks) a buffer in place. The most significant byte of `key` is
// applied to the first byte of `data`, so a key read from the wire in
// big-endian order can be used directly.
// Upon return, `key` has been rotated by the number of bytes processed, so a
// payload may be masked in multiple calls.
void
mask_websocket_payload(char* data, size_t size, uint32_t& key) noexcept;

// Masks (or unmasks) a complete buffer in place.
inline
void
mask_websocket_payload_once(char* data, size_t size, uint32_t key) noexcept
  { mask_websocket_payload(data, size, key);  }

}  // namespace triton
#endif
