// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_HTTP_FIELD_NAME_
#define TRITON_HTTP_HTTP_FIELD_NAME_

#include "../fwd.hpp"
namespace triton {

// This is a header name, which compares case-insensitively.
class HTTP_Field_Name
  {
  private:
    cow_string m_str;

  public:
    HTTP_Field_Name() noexcept = default;

    template<typename xstringT,
    ROCKET_ENABLE_IF(::std::is_constructible<cow_string, xstringT&&>::value)>
    HTTP_Field_Name(xstringT&& xstr)
      noexcept(::std::is_nothrow_constructible<cow_string, xstringT&&>::value)
      :
        m_str(forward<xstringT>(xstr))
      { }

    HTTP_Field_Name&
    swap(HTTP_Field_Name& other) noexcept
      {
        this->m_str.swap(other.m_str);
        return *this;
      }

  public:
    HTTP_Field_Name(const HTTP_Field_Name&) = default;
    HTTP_Field_Name(HTTP_Field_Name&&) = default;
    HTTP_Field_Name& operator=(const HTTP_Field_Name&) & = default;
    HTTP_Field_Name& operator=(HTTP_Field_Name&&) & = default;
    ~HTTP_Field_Name();

    const cow_string&
    str() const noexcept
      { return this->m_str;  }

    cow_string&
    mut_str() noexcept
      { return this->m_str;  }

    bool
    empty() const noexcept
      { return this->m_str.empty();  }

    size_t
    size() const noexcept
      { return this->m_str.size();  }

    const char*
    data() const noexcept
      { return this->m_str.data();  }

    void
    clear() noexcept
      { this->m_str.clear();  }

    HTTP_Field_Name&
    append(const char* str, size_t len)
      {
        this->m_str.append(str, len);
        return *this;
      }

    // Compare names in a case-insensitive way.
    ROCKET_PURE
    bool
    equals(chars_view str) const noexcept
      {
        return ::rocket::ascii_ci_equal(this->m_str.data(), this->m_str.size(),
                                        str.p, str.n);
      }

    ROCKET_PURE
    int
    compare(chars_view str) const noexcept;

    // Gets the case-insensitive hash value of this name.
    ROCKET_PURE
    size_t
    rdhash() const noexcept;

    // Validates this name and converts all ASCII letters to lowercase. If this
    // string is not a valid HTTP token, an exception is thrown, and the string
    // may have been partially modified.
    void
    canonicalize();
  };

inline
void
swap(HTTP_Field_Name& lhs, HTTP_Field_Name& rhs) noexcept
  { lhs.swap(rhs);  }

inline
bool
operator==(const HTTP_Field_Name& lhs, const HTTP_Field_Name& rhs) noexcept
  { return lhs.equals(rhs.str());  }

inline
bool
operator==(const HTTP_Field_Name& lhs, const char* rhs) noexcept
  { return lhs.equals(rhs);  }

inline
bool
operator==(const HTTP_Field_Name& lhs, const cow_string& rhs) noexcept
  { return lhs.equals(rhs);  }

inline
bool
operator!=(const HTTP_Field_Name& lhs, const HTTP_Field_Name& rhs) noexcept
  { return !lhs.equals(rhs.str());  }

inline
bool
operator!=(const HTTP_Field_Name& lhs, const char* rhs) noexcept
  { return !lhs.equals(rhs);  }

inline
bool
operator!=(const HTTP_Field_Name& lhs, const cow_string& rhs) noexcept
  { return !lhs.equals(rhs);  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const HTTP_Field_Name& name)
  { return fmt << name.str();  }

}  // namespace triton
#endif
