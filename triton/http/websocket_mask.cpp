// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "websocket_mask.hpp"
#include "../utils.hpp"
namespace triton {

void
mask_websocket_payload(char* data, size_t size, uint32_t& key) noexcept
  {
    char* cur = data;
    char* const esdata = data + size;

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
    if(esdata - cur >= 4) {
      // Do it four bytes at a time. This loop doesn't alter `key`, as a whole
      // word of key bytes is consumed in each iteration.
      uint32_t bekey = ROCKET_HTOBE32(key);
      while(esdata - cur >= 4) {
        uint32_t word;
        ::memcpy(&word, cur, 4);
        word ^= bekey;
        ::memcpy(cur, &word, 4);
        cur += 4;
      }
    }

    while(cur != esdata) {
      key = key << 8 | key >> 24;
      *cur ^= key;
      cur ++;
    }
#pragma GCC diagnostic pop
  }

}  // namespace triton
