// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "websocket_close_reason.hpp"
#include "../utils.hpp"
namespace triton {

WebSocket_Error
WebSocket_Close_Reason::
parse(opt<WebSocket_Close_Reason>& reason, chars_view payload)
  {
    reason.reset();
    if(payload.n == 0)
      return ws_error_none;

    if(payload.n == 1)
      return WebSocket_Error(ws_error_invalid_length, 1);

    // Get the status code in big-endian order.
    uint16_t bestatus;
    ::memcpy(&bestatus, payload.p, 2);
    payload >>= 2;

    if(!is_valid_utf8(payload))
      return ws_error_invalid_utf8;

    auto& r = reason.emplace(static_cast<WS_Status>(ROCKET_BETOH16(bestatus)));
    if(payload.n != 0)
      r.description.emplace(payload.p, payload.n);
    return ws_error_none;
  }

void
WebSocket_Close_Reason::
encode(tinyfmt& fmt) const
  {
    uint16_t bestatus = ROCKET_HTOBE16(static_cast<uint16_t>(this->code));
    fmt.putn(reinterpret_cast<const char*>(&bestatus), 2);

    if(!this->description)
      return;

    // A control frame shall not be fragmented, so its payload cannot exceed
    // 125 bytes. Do not leave a partial UTF-8 sequence behind.
    const auto& desc = *(this->description);
    size_t len = desc.size();
    if(len > 123) {
      len = 123;
      while((len != 0) && ((static_cast<unsigned char>(desc[len]) & 0xC0) == 0x80))
        len --;
    }
    fmt.putn(desc.data(), len);
  }

}  // namespace triton
