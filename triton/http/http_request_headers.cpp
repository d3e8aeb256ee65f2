// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_request_headers.hpp"
#include "../utils.hpp"
namespace triton {

void
HTTP_Request_Headers::
set_method(chars_view str) noexcept
  {
    this->method = http_NULL;
    ::memcpy(this->method_str, str.p, min(str.n, sizeof(this->method_str)));
  }

const cow_string*
HTTP_Request_Headers::
find_header(chars_view name) const noexcept
  {
    for(const auto& hr : this->headers)
      if(hr.first.equals(name))
        return &(hr.second);
    return nullptr;
  }

void
HTTP_Request_Headers::
encode(tinyfmt& fmt) const
  {
    // Write the request line. If `method` is empty, `GET` is assumed. This
    // function does not validate whether these fields contain valid values.
    if(this->method == http_NULL)
      fmt << "GET ";
    else
      fmt.putn(this->method_str, ::strnlen(this->method_str, 8)) << " ";

    if(this->uri.empty() || (this->uri[0] != '/'))
      fmt << '/';
    fmt << this->uri << " HTTP/1.1";

    // Write request headers. Empty headers are ignored.
    for(const auto& hr : this->headers)
      if(!hr.first.empty())
        fmt << "\r\n" << hr.first << ": " << hr.second;

    // Terminate the request with an empty line.
    fmt << "\r\n\r\n";
  }

}  // namespace triton
