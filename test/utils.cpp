// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../triton/utils.hpp"
using namespace ::triton;

int
main()
  {
    try {
      TRITON_THROW((
          "test $1 $2 $$/end"),
          "exception:", 42);
    }
    catch(exception& e) {
      TRITON_TEST_CHECK(::std::strstr(e.what(),
          "test exception: 42 $/end") != nullptr);
    }

    TRITON_CHECK(1 + 1);
    TRITON_CHECK(true);

    try {
      TRITON_CHECK(0+0);
    }
    catch(exception& e) {
      TRITON_TEST_CHECK(::std::strstr(e.what(),
          "TRITON_CHECK failed: 0+0") != nullptr);
    }

    // UTF-8
    TRITON_TEST_CHECK(is_valid_utf8(""));
    TRITON_TEST_CHECK(is_valid_utf8("hello"));
    TRITON_TEST_CHECK(is_valid_utf8("\xE4\xBD\xA0\xE5\xA5\xBD"));
    TRITON_TEST_CHECK(is_valid_utf8("\xF0\x9F\x98\x80 smile"));
    TRITON_TEST_CHECK(is_valid_utf8(chars_view("a\0b", 3)));
    TRITON_TEST_CHECK(!is_valid_utf8("\xE4\xBD"));  // truncated
    TRITON_TEST_CHECK(!is_valid_utf8("\x80"));  // stray continuation
    TRITON_TEST_CHECK(!is_valid_utf8("\xC0\xAF"));  // overlong
    TRITON_TEST_CHECK(!is_valid_utf8("\xED\xA0\x80"));  // surrogate
    TRITON_TEST_CHECK(!is_valid_utf8("\xF4\x90\x80\x80"));  // above U+10FFFF
    TRITON_TEST_CHECK(!is_valid_utf8("\xFF"));

    // case-insensitive search
    TRITON_TEST_CHECK(ascii_ci_contains("keep-alive, Upgrade", "upgrade"));
    TRITON_TEST_CHECK(ascii_ci_contains("WEBSOCKET", "websocket"));
    TRITON_TEST_CHECK(ascii_ci_contains("anything", ""));
    TRITON_TEST_CHECK(!ascii_ci_contains("keep-alive", "upgrade"));
    TRITON_TEST_CHECK(!ascii_ci_contains("upgrad", "upgrade"));

    // random bytes
    uint32_t r[4] = { };
    random_bytes(r, sizeof(r));
    TRITON_TEST_CHECK((r[0] | r[1] | r[2] | r[3]) != 0);
  }
