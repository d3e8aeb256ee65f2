// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_HTTP_REQUEST_PARSER_
#define TRITON_HTTP_HTTP_REQUEST_PARSER_

#include "../fwd.hpp"
#include "http_request_headers.hpp"
#include <http_parser.h>
namespace triton {

// This parses the head of an HTTP request which is expected to be upgraded to
// another protocol. Request payloads are not supported.
class HTTP_Request_Parser
  {
  private:
    uint32_t m_max_header_length = 16384;

    static const ::http_parser_settings s_settings[1];
    ::http_parser m_parser[1];
    HTTP_Request_Headers m_headers;
    size_t m_header_length = 0;
    bool m_in_value = false;
    bool m_headers_complete = false;
    bool m_upgrade = false;

  public:
    // Constructs a parser for incoming requests.
    HTTP_Request_Parser();

  public:
    HTTP_Request_Parser(const HTTP_Request_Parser&) = delete;
    HTTP_Request_Parser& operator=(const HTTP_Request_Parser&) & = delete;
    ~HTTP_Request_Parser();

    uint32_t
    max_header_length() const noexcept
      { return this->m_max_header_length;  }

    // Has an error occurred?
    bool
    error() const noexcept
      { return HTTP_PARSER_ERRNO(this->m_parser) != HPE_OK;  }

    const char*
    error_description() const noexcept
      { return ::http_errno_description(HTTP_PARSER_ERRNO(this->m_parser));  }

    // Translates the error code to an HTTP status code.
    ROCKET_PURE
    HTTP_Status
    http_status_from_error() const noexcept;

    // Clears all fields. This function shall not be called unless the parser is
    // to be reused for another stream.
    void
    clear() noexcept;

    // Parses the request line and headers of an HTTP request from a stream.
    // `data` may be consumed partially, and must be preserved between calls.
    // Bytes after the end of headers are left in `data`. If `headers_complete()`
    // returns `true` before the call, this function does nothing.
    void
    parse_headers_from_stream(linear_buffer& data, bool eof);

    // Get the parsed headers.
    bool
    headers_complete() const noexcept
      { return this->m_headers_complete;  }

    // Does the request ask for a protocol upgrade?
    bool
    upgrade() const noexcept
      { return this->m_upgrade;  }

    const HTTP_Request_Headers&
    headers() const noexcept
      { return this->m_headers;  }

    HTTP_Request_Headers&
    mut_headers() noexcept
      { return this->m_headers;  }
  };

}  // namespace triton
#endif
