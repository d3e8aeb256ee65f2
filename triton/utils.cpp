// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "xprecompiled.hpp"
#include "utils.hpp"
#include "static/logger.hpp"
#include <rocket/ascii_numput.hpp>
#include <algorithm>
#include <openssl/rand.h>
#include <openssl/err.h>
#define UNW_LOCAL_ONLY  1
#include <libunwind.h>
namespace triton {

bool
do_is_log_enabled(uint8_t level) noexcept
  {
    return logger.enabled(level);
  }

bool
do_push_log_message(uint8_t level, const char* func, const char* file, uint32_t line,
                    void* composer, message_composer_fn* composer_fn)
  {
    ::rocket::tinyfmt_str fmt;
    (* composer_fn) (fmt, composer);
    cow_string sbuf = fmt.extract_string();
    sbuf.erase(sbuf.rfind_not_of(" \t\r\n") + 1);

    // Enqueue the message.
    logger.enqueue(level, func, file, line, sbuf);
    return true;
  }

::std::runtime_error
do_create_runtime_error(const char* func, const char* file, uint32_t line,
                        void* composer, message_composer_fn* composer_fn)
  {
    ::rocket::tinyfmt_str fmt;
    (* composer_fn) (fmt, composer);
    ::std::string sbuf(fmt.c_str(), fmt.length());
    sbuf.erase(sbuf.find_last_not_of(" \t\r\n") + 1);

    // Append the source location and function name.
    ::rocket::ascii_numput nump;
    nump.put_DU(line);
    sbuf += "\n[thrown from function `";
    sbuf += func;
    sbuf += "` at '";
    sbuf += file;
    sbuf += ":";
    sbuf.append(nump.data(), nump.size());
    sbuf += "']";

    ::unw_context_t unw_ctx;
    ::unw_cursor_t unw_top;
    if((::unw_getcontext(&unw_ctx) == 0) && (::unw_init_local(&unw_top, &unw_ctx) == 0)) {
      sbuf += "\n[stack backtrace:";

      // Calculate the number of caller frames, for the width of indices.
      size_t nframes = 0;
      ::unw_cursor_t unw_cur = unw_top;
      while(::unw_step(&unw_cur) > 0)
        nframes ++;

      nump.put_DU(nframes);
      static_vector<char, 8> numfield(nump.size(), ' ');

      nframes = 0;
      unw_cur = unw_top;
      while(::unw_step(&unw_cur) > 0) {
        // * frame index
        nump.put_DU(++ nframes);
        ::std::reverse_copy(nump.begin(), nump.end(), numfield.mut_rbegin());
        sbuf += "\n  ";
        sbuf.append(numfield.data(), numfield.size());
        sbuf += ") ";

        // * instruction pointer
        ::unw_word_t unw_offset;
        ::unw_get_reg(&unw_cur, UNW_REG_IP, &unw_offset);
        nump.put_XU(unw_offset);
        sbuf.append(nump.data(), nump.size());

        char unw_name[1024];
        if(::unw_get_proc_name(&unw_cur, unw_name, sizeof(unw_name), &unw_offset) != 0)
          sbuf += " (unknown)";
        else {
          // * function signature and offset
          sbuf += " `";
          sbuf += unw_name;
          sbuf += "`";
          if(unw_offset > 0) {
            sbuf += "+";
            nump.put_XU(unw_offset);
            sbuf.append(nump.data(), nump.size());
          }
        }
      }

      sbuf += "\n  -- end of stack backtrace]";
    }

    return ::std::runtime_error(sbuf);
  }

bool
is_valid_utf8(chars_view str) noexcept
  {
    const char* pos = str.p;
    const char* const end = str.p + str.n;

    while(pos != end) {
      // Take a shortcut for ASCII characters.
      if(static_cast<unsigned char>(*pos) < 0x80) {
        pos ++;
        continue;
      }

      // `utf8_decode()` rejects overlong and surrogate sequences.
      char32_t cp;
      if(!::asteria::utf8_decode(cp, pos, static_cast<size_t>(end - pos)))
        return false;
    }
    return true;
  }

bool
ascii_ci_contains(chars_view str, chars_view pattern) noexcept
  {
    if(pattern.n == 0)
      return true;

    for(size_t k = 0;  k + pattern.n <= str.n;  ++k)
      if(::rocket::ascii_ci_equal(str.p + k, pattern.n, pattern.p, pattern.n))
        return true;
    return false;
  }

void
random_bytes(void* ptr, size_t size) noexcept
  {
    auto ctx = ::OSSL_LIB_CTX_get0_global_default();
    if(!ctx)
      ASTERIA_TERMINATE((
          "Could not get OpenSSL global context: $1",
          "[`OSSL_LIB_CTX_get0_global_default()` failed]"),
          ::ERR_reason_error_string(::ERR_get_error()));

    if(::RAND_bytes_ex(ctx, static_cast<unsigned char*>(ptr), size, 0) != 1)
      ASTERIA_TERMINATE((
          "Could not generate random bytes: $1",
          "[`RAND_bytes_ex()` failed]"),
          ::ERR_reason_error_string(::ERR_get_error()));
  }

}  // namespace triton
