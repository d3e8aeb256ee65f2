// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_UTILS_
#define TRITON_UTILS_

#include "fwd.hpp"
#include "details/error_handling.hpp"
namespace triton {

// Compose a log message and enqueue it into the global logger. The `TEMPLATE`
// argument shall be a list of string literals in parentheses. Multiple strings
// are joined with line separators. `format()` is to be found via ADL.
#define TRITON_LOG_(LEVEL, TEMPLATE, ...)  \
  (::triton::do_is_log_enabled(LEVEL)  \
   &&  \
   ([&](const char* func_ce7d) -> bool  \
      __attribute__((__nothrow__, __noinline__))  \
    {  \
      try {  \
        auto c_Ru6q = [&](::rocket::tinyfmt& fmt_Ko0i)  \
          {  \
            using ::asteria::format;  \
            format(fmt_Ko0i, (::asteria::make_string_template TEMPLATE),  \
                    ##__VA_ARGS__);  \
          };  \
        \
        ::triton::do_push_log_message(\
            LEVEL, func_ce7d, __FILE__, __LINE__,  \
            &c_Ru6q,  \
            [](::rocket::tinyfmt& fmt_Ko0i, void* p_5Gae)  \
              { (* static_cast<decltype(c_Ru6q)*>(p_5Gae)) (fmt_Ko0i);  });  \
      }  \
      catch(::std::exception& ex_wV3d) {  \
        ::fprintf(stderr, "WARNING: Could not compose log message: %s\n",  \
                  ex_wV3d.what());  \
      }  \
      return true;  \
    } (__func__)))

#define TRITON_LOG_FATAL(...)   TRITON_LOG_(0, __VA_ARGS__)
#define TRITON_LOG_ERROR(...)   TRITON_LOG_(1, __VA_ARGS__)
#define TRITON_LOG_WARN(...)    TRITON_LOG_(2, __VA_ARGS__)
#define TRITON_LOG_INFO(...)    TRITON_LOG_(3, __VA_ARGS__)
#define TRITON_LOG_DEBUG(...)   TRITON_LOG_(4, __VA_ARGS__)
#define TRITON_LOG_TRACE(...)   TRITON_LOG_(5, __VA_ARGS__)

// Throws an `std::runtime_error` object. The `TEMPLATE` argument shall be a
// list of string literals in parentheses. Multiple strings are joined with
// line separators. `format()` is to be found via ADL.
#define TRITON_THROW(TEMPLATE, ...)  \
  (throw \
   ([&](const char* func_ce7d) -> ::std::runtime_error  \
      __attribute__((__noinline__))  \
    {  \
      auto c_Ru6q = [&](::rocket::tinyfmt& fmt_Ko0i)  \
        {  \
          using ::asteria::format;  \
          format(fmt_Ko0i, (::asteria::make_string_template TEMPLATE),  \
                  ##__VA_ARGS__);  \
        };  \
      \
      return ::triton::do_create_runtime_error(\
          func_ce7d, __FILE__, __LINE__,  \
          &c_Ru6q,  \
          [](::rocket::tinyfmt& fmt_Ko0i, void* p_5Gae)  \
            { (* static_cast<decltype(c_Ru6q)*>(p_5Gae)) (fmt_Ko0i);  });  \
    } (__func__)))

#define TRITON_CHECK(...)  \
  (static_cast<bool>(__VA_ARGS__)  \
    ? void()  \
    : TRITON_THROW(("TRITON_CHECK failed: " #__VA_ARGS__)))

// Checks whether a string is valid UTF-8. Overlong sequences, surrogates and
// code points above U+10FFFF are rejected.
ROCKET_PURE
bool
is_valid_utf8(chars_view str) noexcept;

// Searches `str` for `pattern`, ignoring the case of ASCII letters.
ROCKET_PURE
bool
ascii_ci_contains(chars_view str, chars_view pattern) noexcept;

// Generates a cryptographically secure random byte sequence. Please be advised
// that this function may be very slow.
void
random_bytes(void* ptr, size_t size) noexcept;

// Generates a random 32-bit integer, for masking keys.
inline
uint32_t
random_uint32() noexcept
  {
    uint32_t value;
    random_bytes(&value, sizeof(value));
    return value;
  }

}  // namespace triton
#endif
