// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../triton/http/websocket_mask.hpp"
#include "../triton/utils.hpp"
using namespace ::triton;

int
main()
  {
    // https://datatracker.ietf.org/doc/html/rfc6455#section-5.7
    char hello[] = "Hello";
    mask_websocket_payload_once(hello, 5, 0x37fa213d);
    TRITON_TEST_CHECK(::memcmp(hello, "\x7f\x9f\x4d\x51\x58", 5) == 0);
    mask_websocket_payload_once(hello, 5, 0x37fa213d);
    TRITON_TEST_CHECK(::memcmp(hello, "Hello", 5) == 0);

    // Masking twice is the identity, and masking in chunks is the same as
    // masking at once.
    char source[301];
    random_bytes(source, sizeof(source));

    for(uint32_t key : { 0x00000000U, 0xFFFFFFFFU, 0x37fa213dU, 0x01020304U, random_uint32() })
      for(size_t chunk : { 1U, 2U, 3U, 4U, 5U, 7U, 8U, 13U, 64U, 300U }) {
        char once[301];
        ::memcpy(once, source, sizeof(source));
        mask_websocket_payload_once(once, sizeof(once), key);

        char incr[301];
        ::memcpy(incr, source, sizeof(source));
        uint32_t rkey = key;
        for(size_t off = 0;  off < sizeof(incr);  off += chunk)
          mask_websocket_payload(incr + off, min(chunk, sizeof(incr) - off), rkey);

        TRITON_TEST_CHECK(::memcmp(once, incr, sizeof(once)) == 0);

        mask_websocket_payload_once(once, sizeof(once), key);
        TRITON_TEST_CHECK(::memcmp(once, source, sizeof(source)) == 0);
      }

    // A zero key has no effect.
    char zero[] = "abcdefghijk";
    mask_websocket_payload_once(zero, 11, 0);
    TRITON_TEST_CHECK(::memcmp(zero, "abcdefghijk", 11) == 0);

    // The key rotates by the number of bytes processed.
    uint32_t key = 0x11223344;
    char dummy[3] = { };
    mask_websocket_payload(dummy, 3, key);
    TRITON_TEST_CHECK(::memcmp(dummy, "\x11\x22\x33", 3) == 0);
    TRITON_TEST_CHECK(key == 0x44112233);
  }
