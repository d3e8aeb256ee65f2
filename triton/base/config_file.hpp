// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_BASE_CONFIG_FILE_
#define TRITON_BASE_CONFIG_FILE_

#include "../fwd.hpp"
#include <asteria/value.hpp>
namespace triton {

class Config_File
  {
  private:
    cow_string m_path;
    ::asteria::V_object m_root;

  public:
    // Constructs an empty file.
    Config_File() noexcept;

    // Loads the file denoted by `path`.
    explicit Config_File(const cow_string& conf_path);

    Config_File&
    swap(Config_File& other) noexcept
      {
        this->m_path.swap(other.m_path);
        this->m_root.swap(other.m_root);
        return *this;
      }

  public:
    Config_File(const Config_File&) noexcept = default;
    Config_File(Config_File&&) noexcept = default;
    Config_File& operator=(const Config_File&) & noexcept = default;
    Config_File& operator=(Config_File&&) & noexcept = default;
    ~Config_File();

    // Returns the absolute file path.
    // If no file has been loaded, an empty string is returned.
    const cow_string&
    path() const noexcept
      { return this->m_path;  }

    const ::asteria::V_object&
    root() const noexcept
      { return this->m_root;  }

    // Clears existent data.
    void
    clear() noexcept;

    // Loads the file denoted by `path`. In case of an error, an exception is
    // thrown, and there is no effect.
    void
    reload(const cow_string& conf_path);

    // Gets a value denoted by a path, which may look like `foo.bar.value` or
    // `foo.bar[42].value`. If the path does not denote an existent value, a
    // statically allocated null value is returned. If during path resolution,
    // an attempt is made to get a field of a non-object or an element of a
    // non-array, an exception is thrown.
    const ::asteria::Value&
    query(chars_view vpath) const;

    // Get values of specific types. If a non-null value exists, it must have
    // the expected type (and be within the given range, for integers),
    // otherwise an exception is thrown.
    opt<bool>
    get_boolean_opt(chars_view vpath) const;

    opt<int64_t>
    get_integer_opt(chars_view vpath, int64_t min, int64_t max) const;

    opt<cow_string>
    get_string_opt(chars_view vpath) const;

    opt<size_t>
    get_array_size_opt(chars_view vpath) const;

    // Gets a string. The value must exist and must be a string.
    const cow_string&
    get_string(chars_view vpath) const;
  };

inline
void
swap(Config_File& lhs, Config_File& rhs) noexcept
  { lhs.swap(rhs);  }

}  // namespace triton
#endif
