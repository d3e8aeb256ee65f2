// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_field_name.hpp"
#include "../utils.hpp"
namespace triton {
namespace {

// RFC 9110, 5.6.2. Tokens
//   tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." /
//           "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
inline
bool
do_is_tchar(char ch) noexcept
  {
    return ((ch >= '0') && (ch <= '9'))
           || ((ch >= 'A') && (ch <= 'Z'))
           || ((ch >= 'a') && (ch <= 'z'))
           || is_any_of(ch, { '!', '#', '$', '%', '&', '\'', '*', '+', '-', '.',
                              '^', '_', '`', '|', '~' });
  }

}  // namespace

HTTP_Field_Name::
~HTTP_Field_Name()
  {
  }

int
HTTP_Field_Name::
compare(chars_view str) const noexcept
  {
    return ::rocket::ascii_ci_compare(this->m_str.data(), this->m_str.size(), str.p, str.n);
  }

size_t
HTTP_Field_Name::
rdhash() const noexcept
  {
    return ::rocket::ascii_ci_hash(this->m_str.data(), this->m_str.size());
  }

void
HTTP_Field_Name::
canonicalize()
  {
    if(this->m_str.empty())
      TRITON_THROW(("Empty HTTP field name not valid"));

    for(size_t k = 0;  k != this->m_str.size();  ++k) {
      char ch = this->m_str[k];
      if(!do_is_tchar(ch))
        TRITON_THROW(("Invalid character `\\x$1` in HTTP field name `$2`"),
                     static_cast<uint32_t>(static_cast<unsigned char>(ch)), this->m_str);

      if((ch >= 'A') && (ch <= 'Z'))
        this->m_str.mut(k) = static_cast<char>(ch | 0x20);
    }
  }

}  // namespace triton
