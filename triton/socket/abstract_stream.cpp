// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "abstract_stream.hpp"
#include "../utils.hpp"
namespace triton {

Abstract_Stream::
~Abstract_Stream()
  {
  }

}  // namespace triton
