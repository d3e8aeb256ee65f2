// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "main_config.hpp"
#include "../utils.hpp"
namespace triton {

Main_Config::
Main_Config() noexcept
  {
  }

Main_Config::
~Main_Config()
  {
  }

void
Main_Config::
reload(const cow_string& conf_path)
  {
    Config_File file(conf_path);
    TRITON_LOG_INFO(("Loaded configuration file '$1'"), file.path());
    this->install(move(file));
  }

void
Main_Config::
install(Config_File&& file) noexcept
  {
    plain_mutex::unique_lock lock(this->m_mutex);
    this->m_file.swap(file);
  }

Config_File
Main_Config::
copy() const noexcept
  {
    plain_mutex::unique_lock lock(this->m_mutex);
    return this->m_file;
  }

}  // namespace triton
