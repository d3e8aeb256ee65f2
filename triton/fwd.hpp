// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_FWD_
#define TRITON_FWD_

#include "version.h"
#include <rocket/atomic.hpp>
#include <rocket/mutex.hpp>
#include <rocket/recursive_mutex.hpp>
#include <rocket/condition_variable.hpp>
#include <rocket/tinyfmt_str.hpp>
#include <rocket/linear_buffer.hpp>
#include <rocket/unique_posix_fd.hpp>
#include <rocket/static_vector.hpp>
#include <rocket/optional.hpp>
#include <rocket/variant.hpp>
#include <rocket/ascii_case.hpp>
#include <asteria/value.hpp>
#include <asteria/utils.hpp>
#include <vector>
#include <deque>
#include <chrono>

// Defines a private structure which is declared in a public class.
#define TRITON_HIDDEN_X_STRUCT(C, S)  \
  struct __attribute__((__visibility__("hidden"))) C::X_##S  \
    : S { using S::S, S::operator=;  }  // no semicolon

#define TRITON_VISIBILITY_HIDDEN   \
  __attribute__((__visibility__("hidden"))) inline

#define TRITON_USING  \
  template<typename... Ts> using

namespace triton {
namespace fwd {

// Standard types
using ::std::nullptr_t;
using ::std::uint8_t;
using ::std::uint16_t;
using ::std::int32_t;
using ::std::uint32_t;
using ::std::int64_t;
using ::std::uint64_t;
using ::std::size_t;
using ::std::exception;
using ::std::pair;
using ::std::vector;
using ::std::deque;

// Clocks are only used for close timeouts.
using ::std::chrono::steady_clock;
using steady_time = steady_clock::time_point;
using milliseconds = ::std::chrono::duration<int64_t, ::std::milli>;
using seconds = ::std::chrono::duration<int, ::std::ratio<1>>;

// Rocket types
using ::rocket::atomic_relaxed;
using ::rocket::atomic_acq_rel;
using plain_mutex = ::rocket::mutex;
using ::rocket::recursive_mutex;
using ::rocket::condition_variable;
using ::rocket::cow_vector;
using ::rocket::static_vector;
using ::rocket::cow_string;
using ::rocket::linear_buffer;
using ::rocket::tinyfmt;
using ::rocket::tinyfmt_str;
using ::rocket::unique_posix_fd;

TRITON_USING cow_bivector = cow_vector<pair<Ts...>>;
TRITON_USING opt = ::rocket::optional<Ts...>;

using ::rocket::swap;
using ::rocket::move;
using ::rocket::forward;
using ::rocket::size;
using ::rocket::min;
using ::rocket::is_any_of;
using ::rocket::nullopt;
using ::rocket::sref;
using ::rocket::xmemeq;

using ::asteria::format;
using ::asteria::sformat;

// This is a non-owning reference to a byte string, which is used everywhere a
// payload is passed to the protocol engine.
struct chars_view
  {
    const char* p;
    size_t n;

    constexpr
    chars_view(nullptr_t = nullptr) noexcept
      : p(nullptr), n(0U)  { }

    constexpr
    chars_view(const char* xp, size_t xn) noexcept
      : p(xp), n(xn)  { }

    constexpr
    chars_view(const char* xs) noexcept
      : p(xs), n(xs ? ::rocket::xstrlen(xs) : 0U)  { }

    constexpr
    chars_view(const ::rocket::shallow_string rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    template<typename allocT>
    constexpr
    chars_view(const ::rocket::basic_cow_string<char, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    template<typename allocT>
    constexpr
    chars_view(const ::rocket::basic_tinyfmt_str<char, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    template<typename allocT>
    constexpr
    chars_view(const ::rocket::basic_linear_buffer<char, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    constexpr
    char
    operator[](size_t index) const noexcept
      { return ROCKET_ASSERT(index <= this->n), *(this->p + index);  }

    // Moves the view to the right.
    constexpr
    chars_view
    operator>>(size_t dist) const noexcept
      { return chars_view(this->p + dist, this->n - dist);  }

    constexpr
    chars_view&
    operator>>=(size_t dist) & noexcept
      { return *this = *this >> dist;  }

    // Makes a copy.
    explicit operator cow_string() const
      { return cow_string(this->p, this->n);  }
  };

inline
tinyfmt&
operator<<(tinyfmt& fmt, chars_view data)
  { return fmt.putn(data.p, data.n);  }

constexpr
bool
operator==(chars_view lhs, chars_view rhs) noexcept
  { return (lhs.n == rhs.n) && (::rocket::xmemcmp(lhs.p, rhs.p, lhs.n) == 0);  }

constexpr
bool
operator==(chars_view lhs, const char* rhs) noexcept
  { return (lhs.n == ::rocket::xstrlen(rhs)) && (::rocket::xmemcmp(lhs.p, rhs, lhs.n) == 0);  }

constexpr
bool
operator!=(chars_view lhs, chars_view rhs) noexcept
  { return (lhs.n != rhs.n) || (::rocket::xmemcmp(lhs.p, rhs.p, lhs.n) != 0);  }

constexpr
bool
operator!=(chars_view lhs, const char* rhs) noexcept
  { return (lhs.n != ::rocket::xstrlen(rhs)) || (::rocket::xmemcmp(lhs.p, rhs, lhs.n) != 0);  }

}  // namespace fwd
using namespace fwd;

// Base types
class Config_File;

// Socket types
enum Socket_State : uint8_t;
enum WS_Dispatcher_State : uint8_t;
class Abstract_Stream;
class Socket_Stream;
class WebSocket_Dispatcher;

// HTTP and WebSocket types
enum HTTP_Method : uint64_t;
enum HTTP_Status : uint16_t;
enum WS_Opcode : uint8_t;
enum WS_Status : uint16_t;
enum WS_Fragment : uint8_t;
enum WS_Role : uint8_t;
enum WS_Error : uint8_t;
enum WS_Handshake_Error : uint8_t;
class HTTP_Field_Name;
struct HTTP_Request_Headers;
struct HTTP_Response_Headers;
class HTTP_Request_Parser;
struct WebSocket_Frame_Header;
struct WebSocket_Frame;
class WebSocket_Frame_Parser;
class WebSocket_Error;
struct WebSocket_Close_Reason;
class WebSocket_Message;
class WebSocket_Assembler;

// Singletons
extern const cow_string empty_cow_string;
extern class Main_Config& main_config;
extern class Logger& logger;

}  // namespace triton
#endif
