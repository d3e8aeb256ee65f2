// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "xprecompiled.hpp"
#include "fwd.hpp"
#include "static/main_config.hpp"
#include "static/logger.hpp"
namespace triton {

const cow_string empty_cow_string;

Main_Config& main_config = *new Main_Config;
Logger& logger = *new Logger;

}  // namespace triton
