// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "websocket_message.hpp"
#include "../utils.hpp"
namespace triton {

chars_view
WebSocket_Message::
payload() const noexcept
  {
    switch(this->kind())
      {
      case ws_message_text:
        return this->m_stor.as<Text>().data;

      case ws_message_binary:
        return this->m_stor.as<Binary>().data;

      case ws_message_continuation:
        return this->m_stor.as<Continuation>().data;

      case ws_message_ping:
        return this->m_stor.as<Ping>().data;

      case ws_message_pong:
        return this->m_stor.as<Pong>().data;

      case ws_message_close:
        {
          const auto& reason = this->m_stor.as<Close>().reason;
          if(reason && reason->description)
            return *(reason->description);
          return nullptr;
        }

      default:
        return nullptr;
      }
  }

WS_Opcode
WebSocket_Message::
opcode() const noexcept
  {
    switch(this->kind())
      {
      case ws_message_text:
        return ws_TEXT;

      case ws_message_binary:
        return ws_BINARY;

      case ws_message_continuation:
        switch(this->m_stor.as<Continuation>().fragment)
          {
          case ws_fragment_first_text:
            return ws_TEXT;

          case ws_fragment_first_binary:
            return ws_BINARY;

          default:
            return ws_CONTINUATION;
          }

      case ws_message_ping:
        return ws_PING;

      case ws_message_pong:
        return ws_PONG;

      case ws_message_close:
        return ws_CLOSE;

      default:
        return ws_CONTINUATION;
      }
  }

tinyfmt&
WebSocket_Message::
describe(tinyfmt& fmt) const
  {
    switch(this->kind())
      {
      case ws_message_nop:
        return fmt << "NOP";

      case ws_message_text:
        return format(fmt, "TEXT ($1 bytes)", this->as_text().size());

      case ws_message_binary:
        return format(fmt, "BINARY ($1 bytes)", this->as_binary().size());

      case ws_message_continuation:
        {
          static constexpr char names[][16] = { "first text", "first binary", "continue", "last" };
          const auto& alt = this->as_continuation();
          return format(fmt, "CONTINUATION [$1] ($2 bytes)",
                        names[static_cast<uint32_t>(alt.fragment) & 3U], alt.data.size());
        }

      case ws_message_ping:
        return format(fmt, "PING ($1 bytes)", this->as_ping().size());

      case ws_message_pong:
        return format(fmt, "PONG ($1 bytes)", this->as_pong().size());

      case ws_message_close:
        {
          const auto& reason = this->as_close();
          if(!reason)
            return fmt << "CLOSE";

          fmt << "CLOSE " << static_cast<uint32_t>(reason->code);
          if(reason->description)
            fmt << ": " << *(reason->description);
          return fmt;
        }

      default:
        return format(fmt, "unknown message kind `$1`", static_cast<uint32_t>(this->kind()));
      }
  }

}  // namespace triton
