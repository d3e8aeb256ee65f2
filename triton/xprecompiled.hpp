// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_XPRECOMPILED_
#define TRITON_XPRECOMPILED_

// This header is included first by every source file, and is also used as
// the precompiled header of the library.
#include "version.h"

// Standard streams are never used. Logs and diagnostics go through `tinyfmt`.
#define _IOS_BASE_H  1
#define _GLIBCXX_ISTREAM  1
#define _GLIBCXX_OSTREAM  1
#define _GLIBCXX_IOSTREAM  1

#include <rocket/cow_string.hpp>
#include <rocket/cow_vector.hpp>
#include <rocket/linear_buffer.hpp>
#include <rocket/tinyfmt_str.hpp>
#include <rocket/variant.hpp>
#include <rocket/optional.hpp>
#include <rocket/unique_posix_fd.hpp>
#include <rocket/mutex.hpp>
#include <rocket/recursive_mutex.hpp>
#include <rocket/atomic.hpp>
#include <rocket/ascii_case.hpp>

#include <utility>
#include <exception>
#include <typeinfo>
#include <chrono>
#include <vector>
#include <deque>

#include <cstdio>
#include <cstring>
#include <cerrno>

#include <sys/types.h>
#include <unistd.h>
#include <endian.h>

#endif
