// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "websocket_assembler.hpp"
#include "websocket_frame_parser.hpp"
#include "websocket_close_reason.hpp"
#include "../base/config_file.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
namespace triton {
namespace {

WebSocket_Error
do_make_data_message(WebSocket_Message& msg, WS_Opcode opcode, cow_string&& data)
  {
    if(opcode == ws_TEXT) {
      if(!is_valid_utf8(data))
        return ws_error_invalid_utf8;

      msg = WebSocket_Message::Text{ move(data) };
      return ws_error_none;
    }

    msg = WebSocket_Message::Binary{ move(data) };
    return ws_error_none;
  }

}  // namespace

WebSocket_Assembler::
WebSocket_Assembler()
  {
    const auto conf_file = main_config.copy();
    this->m_max_message_length = static_cast<uint64_t>(
        conf_file.get_integer_opt(sref("network.websocket.max_message_length"),
                                  0x100, 0x40000000).value_or(1048576));
  }

WebSocket_Assembler::
~WebSocket_Assembler()
  {
  }

void
WebSocket_Assembler::
clear() noexcept
  {
    this->m_active = false;
    this->m_opcode = ws_CONTINUATION;
    this->m_buffer.clear();
    this->m_error = ws_error_none;
  }

void
WebSocket_Assembler::
deallocate() noexcept
  {
    this->m_active = false;
    cow_string().swap(this->m_buffer);
  }

WebSocket_Error
WebSocket_Assembler::
accept_frame(WebSocket_Message& msg, WebSocket_Frame&& frame)
  {
    msg = WebSocket_Message();
    if(this->m_error)
      return this->m_error;

    switch(static_cast<uint32_t>(frame.opcode))
      {
      case ws_PING:
        msg = WebSocket_Message::Ping{ move(frame.payload) };
        return ws_error_none;

      case ws_PONG:
        msg = WebSocket_Message::Pong{ move(frame.payload) };
        return ws_error_none;

      case ws_CLOSE:
        {
          opt<WebSocket_Close_Reason> reason;
          auto err = WebSocket_Close_Reason::parse(reason, frame.payload);
          if(err)
            return this->m_error = err;

          msg = WebSocket_Message::Close{ move(reason) };
          return ws_error_none;
        }

      case ws_TEXT:
      case ws_BINARY:
        {
          if(this->m_active)
            return this->m_error = ws_error_continuation_started;

          if(frame.payload.size() > this->m_max_message_length)
            return this->m_error = WebSocket_Error(ws_error_overflow, frame.payload.size());

          if(frame.fin)
            return this->m_error = do_make_data_message(msg, frame.opcode, move(frame.payload));

          // Start a new message.
          this->m_active = true;
          this->m_opcode = frame.opcode;

          if(this->m_raw_fragments) {
            auto fragment = (frame.opcode == ws_TEXT) ? ws_fragment_first_text : ws_fragment_first_binary;
            msg = WebSocket_Message::Continuation{ fragment, move(frame.payload) };
            return ws_error_none;
          }

          this->m_buffer.swap(frame.payload);
          return ws_error_none;
        }

      case ws_CONTINUATION:
        {
          if(!this->m_active)
            return this->m_error = ws_error_continuation_not_started;

          if(this->m_raw_fragments) {
            if(frame.payload.size() > this->m_max_message_length) {
              this->deallocate();
              return this->m_error = WebSocket_Error(ws_error_overflow, frame.payload.size());
            }

            auto fragment = frame.fin ? ws_fragment_last : ws_fragment_continue;
            msg = WebSocket_Message::Continuation{ fragment, move(frame.payload) };
            if(frame.fin)
              this->m_active = false;
            return ws_error_none;
          }

          uint64_t total = this->m_buffer.size() + frame.payload.size();
          if(total > this->m_max_message_length) {
            this->deallocate();
            return this->m_error = WebSocket_Error(ws_error_overflow, total);
          }

          this->m_buffer.append(frame.payload.data(), frame.payload.size());
          if(!frame.fin)
            return ws_error_none;

          // The message is complete.
          this->m_active = false;
          cow_string data;
          data.swap(this->m_buffer);
          return this->m_error = do_make_data_message(msg, this->m_opcode, move(data));
        }

      default:
        return this->m_error = ws_error_bad_opcode;
      }
  }

}  // namespace triton
