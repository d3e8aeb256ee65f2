// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_HTTP_RESPONSE_HEADERS_
#define TRITON_HTTP_HTTP_RESPONSE_HEADERS_

#include "../fwd.hpp"
#include "http_field_name.hpp"
#include "enums.hpp"
namespace triton {

struct HTTP_Response_Headers
  {
    HTTP_Status status = http_status_null;
    cow_string reason;
    cow_bivector<HTTP_Field_Name, cow_string> headers;

    HTTP_Response_Headers&
    swap(HTTP_Response_Headers& other) noexcept
      {
        ::std::swap(this->status, other.status);
        this->reason.swap(other.reason);
        this->headers.swap(other.headers);
        return *this;
      }

    // Clears all fields.
    void
    clear() noexcept
      {
        this->status = http_status_null;
        this->reason.clear();
        this->headers.clear();
      }

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
swap(HTTP_Response_Headers& lhs, HTTP_Response_Headers& rhs) noexcept
  { lhs.swap(rhs);  }

}  // namespace triton
#endif
