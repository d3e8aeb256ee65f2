// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "config_file.hpp"
#include "../utils.hpp"
#include <asteria/utils.hpp>
#include <asteria/library/system.hpp>
namespace triton {

Config_File::
Config_File() noexcept
  {
  }

Config_File::
Config_File(const cow_string& conf_path)
  {
    this->reload(conf_path);
  }

Config_File::
~Config_File()
  {
  }

void
Config_File::
clear() noexcept
  {
    this->m_path.clear();
    this->m_root.clear();
  }

void
Config_File::
reload(const cow_string& conf_path)
  {
    auto real_path = ::asteria::get_real_path(conf_path);
    auto real_root = ::asteria::std_system_load_conf(real_path);

    // This will not throw exceptions.
    this->m_path.swap(real_path);
    this->m_root.swap(real_root);
  }

const ::asteria::Value&
Config_File::
query(chars_view vpath) const
  {
    const ::asteria::Value* current = nullptr;
    size_t offset = 0;

    if(vpath.n == 0)
      TRITON_THROW((
          "Invalid value path: empty path not allowed",
          "[in configuration file '$1']"),
          this->m_path);

    while(offset != vpath.n) {
      // Get a name, which is terminated by a dot, an open bracket, or the end
      // of the path.
      size_t bpos = offset;
      while((offset != vpath.n) && !is_any_of(vpath.p[offset], {'.', '['}))
        offset ++;

      if(bpos == offset)
        TRITON_THROW((
            "Invalid value path `$1` at offset `$2`: name expected",
            "[in configuration file '$3']"),
            vpath, offset, this->m_path);

      const ::asteria::V_object* parent = &(this->m_root);
      if(current && current->is_object())
        parent = &(current->as_object());
      else if(current)
        TRITON_THROW((
            "Invalid value path `$1` at offset `$2`: invalid subscript of non-object",
            "[in configuration file '$3']"),
            vpath, offset, this->m_path);

      current = parent->ptr(cow_string(vpath.p + bpos, offset - bpos));
      if(!current)
        return ::asteria::null;

      // Apply array subscripts, if any.
      while((offset != vpath.n) && (vpath.p[offset] == '[')) {
        uint32_t index = 0;
        bpos = ++ offset;
        while((offset != vpath.n) && (vpath.p[offset] >= '0') && (vpath.p[offset] <= '9')) {
          if(index >= 999999)
            TRITON_THROW((
                "Invalid value path `$1` at offset `$2`: integer too large",
                "[in configuration file '$3']"),
                vpath, offset, this->m_path);

          index = index * 10 + static_cast<uint32_t>(vpath.p[offset] - '0');
          offset ++;
        }

        if((bpos == offset) || (offset == vpath.n) || (vpath.p[offset] != ']'))
          TRITON_THROW((
              "Invalid value path `$1` at offset `$2`: closed bracket expected",
              "[in configuration file '$3']"),
              vpath, offset, this->m_path);

        if(!current->is_array())
          TRITON_THROW((
              "Invalid value path `$1` at offset `$2`: invalid subscript of non-array",
              "[in configuration file '$3']"),
              vpath, offset, this->m_path);

        current = current->as_array().ptr(index);
        if(!current)
          return ::asteria::null;

        offset ++;
      }

      // Skip the dot before the next name.
      if((offset != vpath.n) && (vpath.p[offset] == '.') && (++ offset == vpath.n))
        TRITON_THROW((
            "Invalid value path `$1`: unexpected end of input",
            "[in configuration file '$2']"),
            vpath, this->m_path);
    }

    ROCKET_ASSERT(current);
    return *current;
  }

opt<bool>
Config_File::
get_boolean_opt(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_boolean())
      TRITON_THROW((
          "Invalid `$1`: expecting a `boolean`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_boolean();
  }

opt<int64_t>
Config_File::
get_integer_opt(chars_view vpath, int64_t min, int64_t max) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_integer())
      TRITON_THROW((
          "Invalid `$1`: expecting an `integer`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    if((value.as_integer() < min) || (value.as_integer() > max))
      TRITON_THROW((
          "Invalid `$1`: value `$2` out of range [$4,$5]",
          "[in configuration file '$3']"),
          vpath, value, this->m_path, min, max);

    return value.as_integer();
  }

opt<cow_string>
Config_File::
get_string_opt(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_string())
      TRITON_THROW((
          "Invalid `$1`: expecting a `string`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_string();
  }

opt<size_t>
Config_File::
get_array_size_opt(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_array())
      TRITON_THROW((
          "Invalid `$1`: expecting an `array`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_array().size();
  }

const cow_string&
Config_File::
get_string(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(!value.is_string())
      TRITON_THROW((
          "Invalid `$1`: expecting a `string`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_string();
  }

}  // namespace triton
