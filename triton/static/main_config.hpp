// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_STATIC_MAIN_CONFIG_
#define TRITON_STATIC_MAIN_CONFIG_

#include "../fwd.hpp"
#include "../base/config_file.hpp"
namespace triton {

class Main_Config
  {
  private:
    mutable plain_mutex m_mutex;
    Config_File m_file;

  public:
    // Constructs an empty configuration file. Until a file is loaded, all
    // components use their built-in defaults.
    Main_Config() noexcept;

  public:
    Main_Config(const Main_Config&) = delete;
    Main_Config& operator=(const Main_Config&) & = delete;
    ~Main_Config();

    // Reloads 'main.conf', or another file.
    // If this function fails, an exception is thrown, and there is no effect.
    // This function is thread-safe.
    void
    reload(const cow_string& conf_path = sref("main.conf"));

    // Replaces the current file with one that has been loaded elsewhere. Only
    // components that are constructed afterwards will see new values.
    // This function is thread-safe.
    void
    install(Config_File&& file) noexcept;

    // Copies the current file.
    // Configuration files are reference-counted and cheap to copy.
    // This function is thread-safe.
    Config_File
    copy() const noexcept;
  };

}  // namespace triton
#endif
