// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_HTTP_WEBSOCKET_MESSAGE_
#define TRITON_HTTP_WEBSOCKET_MESSAGE_

#include "../fwd.hpp"
#include "enums.hpp"
#include "websocket_close_reason.hpp"
namespace triton {

// The order of these enumerators must match the alternatives of
// `WebSocket_Message::m_stor`.
enum WS_Message_Kind : uint8_t
  {
    ws_message_nop           = 0,
    ws_message_text          = 1,
    ws_message_binary        = 2,
    ws_message_continuation  = 3,
    ws_message_ping          = 4,
    ws_message_pong          = 5,
    ws_message_close         = 6,
  };

class WebSocket_Message
  {
  public:
    struct Nop { };
    struct Text { cow_string data; };
    struct Binary { cow_string data; };
    struct Continuation { WS_Fragment fragment; cow_string data; };
    struct Ping { cow_string data; };
    struct Pong { cow_string data; };
    struct Close { opt<WebSocket_Close_Reason> reason; };

  private:
    ::rocket::variant<Nop, Text, Binary, Continuation, Ping, Pong, Close> m_stor;

  public:
    WebSocket_Message() noexcept = default;

    WebSocket_Message(Text&& alt) noexcept
      : m_stor(move(alt))  { }

    WebSocket_Message(Binary&& alt) noexcept
      : m_stor(move(alt))  { }

    WebSocket_Message(Continuation&& alt) noexcept
      : m_stor(move(alt))  { }

    WebSocket_Message(Ping&& alt) noexcept
      : m_stor(move(alt))  { }

    WebSocket_Message(Pong&& alt) noexcept
      : m_stor(move(alt))  { }

    WebSocket_Message(Close&& alt) noexcept
      : m_stor(move(alt))  { }

    WebSocket_Message&
    swap(WebSocket_Message& other) noexcept
      {
        this->m_stor.swap(other.m_stor);
        return *this;
      }

  public:
    WS_Message_Kind
    kind() const noexcept
      { return static_cast<WS_Message_Kind>(this->m_stor.index());  }

    bool
    is_nop() const noexcept
      { return this->m_stor.ptr<Nop>() != nullptr;  }

    bool
    is_text() const noexcept
      { return this->m_stor.ptr<Text>() != nullptr;  }

    const cow_string&
    as_text() const
      { return this->m_stor.as<Text>().data;  }

    bool
    is_binary() const noexcept
      { return this->m_stor.ptr<Binary>() != nullptr;  }

    const cow_string&
    as_binary() const
      { return this->m_stor.as<Binary>().data;  }

    bool
    is_continuation() const noexcept
      { return this->m_stor.ptr<Continuation>() != nullptr;  }

    const Continuation&
    as_continuation() const
      { return this->m_stor.as<Continuation>();  }

    bool
    is_ping() const noexcept
      { return this->m_stor.ptr<Ping>() != nullptr;  }

    const cow_string&
    as_ping() const
      { return this->m_stor.as<Ping>().data;  }

    bool
    is_pong() const noexcept
      { return this->m_stor.ptr<Pong>() != nullptr;  }

    const cow_string&
    as_pong() const
      { return this->m_stor.as<Pong>().data;  }

    bool
    is_close() const noexcept
      { return this->m_stor.ptr<Close>() != nullptr;  }

    const opt<WebSocket_Close_Reason>&
    as_close() const
      { return this->m_stor.as<Close>().reason;  }

    // Gets the payload of a message of any kind. For CLOSE messages this is
    // the description, if any.
    chars_view
    payload() const noexcept;

    // Gets the opcode of the first frame that carries this message. NOP
    // messages have no opcode, and `ws_CONTINUATION` is returned.
    WS_Opcode
    opcode() const noexcept;

    // Writes a short description of this message for logging. The payload is
    // not included.
    tinyfmt&
    describe(tinyfmt& fmt) const;
  };

inline
void
swap(WebSocket_Message& lhs, WebSocket_Message& rhs) noexcept
  { lhs.swap(rhs);  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const WebSocket_Message& msg)
  { return msg.describe(fmt);  }

}  // namespace triton
#endif
