// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_request_parser.hpp"
#include "../base/config_file.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
namespace triton {

TRITON_VISIBILITY_HIDDEN
const ::http_parser_settings
HTTP_Request_Parser::s_settings[1] =
#define this   static_cast<HTTP_Request_Parser*>(ps->data)
  {{
    // on_message_begin
    nullptr,

    // on_url
    +[](::http_parser* ps, const char* str, size_t len)
      {
        this->m_headers.uri.append(str, len);
        return 0;
      },

    // on_status
    nullptr,

    // on_header_field
    +[](::http_parser* ps, const char* str, size_t len)
      {
        // If this notification is received when no header exists, or a previous
        // header value has been accepted, then a new header starts.
        auto& headers = this->m_headers.headers;
        if(headers.empty() || this->m_in_value)
          headers.emplace_back();

        this->m_in_value = false;

        // Append the header name to the last key, as this callback might be
        // invoked repeatedly.
        headers.mut_back().first.append(str, len);
        return 0;
      },

    // on_header_value
    +[](::http_parser* ps, const char* str, size_t len)
      {
        this->m_headers.headers.mut_back().second.append(str, len);
        this->m_in_value = true;
        return 0;
      },

    // on_headers_complete
    +[](::http_parser* ps)
      {
        const char* method_str = ::http_method_str(static_cast<::http_method>(ps->method));
        this->m_headers.set_method(method_str);
        this->m_upgrade = ps->upgrade != 0;
        return 0;
      },

    // on_body
    nullptr,

    // on_message_complete
    +[](::http_parser* ps)
      {
        // Halt here, so bytes after the request are left intact. If the request
        // asks for an upgrade, they belong to the new protocol.
        this->m_headers_complete = true;
        ps->http_errno = HPE_PAUSED;
        return 0;
      },

    // on_chunk_header
    nullptr,

    // on_chunk_complete
    nullptr,
  }};
#undef this

HTTP_Request_Parser::
HTTP_Request_Parser()
  {
    ::http_parser_init(this->m_parser, HTTP_REQUEST);
    this->m_parser->data = this;

    const auto conf_file = main_config.copy();
    this->m_max_header_length = static_cast<uint32_t>(
        conf_file.get_integer_opt(sref("network.http.max_request_header_length"),
                                  0x100, 0x100000).value_or(this->m_max_header_length));
  }

HTTP_Request_Parser::
~HTTP_Request_Parser()
  {
  }

HTTP_Status
HTTP_Request_Parser::
http_status_from_error() const noexcept
  {
    switch(HTTP_PARSER_ERRNO(this->m_parser))
      {
      case HPE_OK:
      case HPE_PAUSED:
        return http_status_ok;

      case HPE_INVALID_VERSION:
        return http_status_http_version_not_supported;

      case HPE_INVALID_METHOD:
        return http_status_method_not_allowed;

      case HPE_HEADER_OVERFLOW:
        return http_status_payload_too_large;

      default:
        return http_status_bad_request;
      }
  }

void
HTTP_Request_Parser::
clear() noexcept
  {
    ::http_parser_init(this->m_parser, HTTP_REQUEST);
    this->m_parser->data = this;

    this->m_headers.clear();
    this->m_header_length = 0;
    this->m_in_value = false;
    this->m_headers_complete = false;
    this->m_upgrade = false;
  }

void
HTTP_Request_Parser::
parse_headers_from_stream(linear_buffer& data, bool eof)
  {
    if(this->m_headers_complete || this->error())
      return;

    // Consume incoming data.
    if(data.size() != 0) {
      size_t nparsed = ::http_parser_execute(this->m_parser, s_settings, data.data(), data.size());
      data.discard(nparsed);
      this->m_header_length += nparsed;
    }

    // If the caller indicates EOF, then also notify the HTTP parser an EOF.
    if(eof && !this->m_headers_complete)
      ::http_parser_execute(this->m_parser, s_settings, "", 0);

    // If the parser has been paused, unpause it, so the caller won't see it.
    if(HTTP_PARSER_ERRNO(this->m_parser) == HPE_PAUSED)
      this->m_parser->http_errno = HPE_OK;

    if(!this->m_headers_complete && !this->error()
       && (this->m_header_length > this->m_max_header_length))
      this->m_parser->http_errno = HPE_HEADER_OVERFLOW;
  }

}  // namespace triton
