// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_HTTP_REQUEST_HEADERS_
#define TRITON_HTTP_HTTP_REQUEST_HEADERS_

#include "../fwd.hpp"
#include "http_field_name.hpp"
#include "enums.hpp"
namespace triton {

struct HTTP_Request_Headers
  {
    union {
      HTTP_Method method = http_NULL;
      char method_str[8];
    };

    cow_string uri;
    cow_bivector<HTTP_Field_Name, cow_string> headers;

    HTTP_Request_Headers&
    swap(HTTP_Request_Headers& other) noexcept
      {
        ::std::swap(this->method, other.method);
        this->uri.swap(other.uri);
        this->headers.swap(other.headers);
        return *this;
      }

    // Clears all fields.
    void
    clear() noexcept
      {
        this->method = http_NULL;
        this->uri.clear();
        this->headers.clear();
      }

    // Sets the method from a string. Names longer than eight characters are
    // truncated.
    void
    set_method(chars_view str) noexcept;

    // Gets the value of the first header with the given name. If no such
    // header exists, a null pointer is returned.
    const cow_string*
    find_header(chars_view name) const noexcept;

    // Encodes headers in wire format. Lines are separated by CR LF pairs. The
    // output will be suitable for sending through a stream socket.
    void
    encode(tinyfmt& fmt) const;
  };

inline
void
swap(HTTP_Request_Headers& lhs, HTTP_Request_Headers& rhs) noexcept
  { lhs.swap(rhs);  }

}  // namespace triton
#endif
