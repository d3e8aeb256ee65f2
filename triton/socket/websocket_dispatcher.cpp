// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "websocket_dispatcher.hpp"
#include "../http/websocket_close_reason.hpp"
#include "../base/config_file.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
namespace triton {

WebSocket_Dispatcher::
WebSocket_Dispatcher(Abstract_Stream& stream, WS_Role role)
  :
    m_stream(&stream), m_role(role), m_parser(role)
  {
    this->m_state.store(ws_dispatcher_open);
    this->m_frames_in.store(0);
    this->m_bytes_in.store(0);
    this->m_frames_out.store(0);
    this->m_bytes_out.store(0);

    const auto conf_file = main_config.copy();
    this->m_auto_pong = conf_file.get_boolean_opt(sref("network.websocket.auto_pong"))
                        .value_or(this->m_auto_pong);

    this->m_close_timeout = milliseconds(
        conf_file.get_integer_opt(sref("network.websocket.close_timeout"), 0, 3600000)
        .value_or(this->m_close_timeout.count()));

    this->m_max_inbound_messages = static_cast<size_t>(
        conf_file.get_integer_opt(sref("network.websocket.max_inbound_messages"), 1, 0x100000)
        .value_or(static_cast<int64_t>(this->m_max_inbound_messages)));
  }

WebSocket_Dispatcher::
~WebSocket_Dispatcher()
  {
  }

bool
WebSocket_Dispatcher::
do_send_frame_nolock(WS_Opcode opcode, bool fin, chars_view payload)
  {
    // Frames from a client must be masked with a new random key.
    opt<uint32_t> masking_key;
    if(this->m_role == ws_role_client)
      masking_key = random_uint32();

    tinyfmt_str fmt;
    encode_websocket_frame(fmt, opcode, fin, masking_key, payload);
    this->m_frames_out.xadd(1);
    this->m_bytes_out.xadd(payload.n);

    TRITON_LOG_TRACE((
        "WebSocket frame sent: fin = $1, opcode = $2, length = $3"),
        fin, static_cast<uint32_t>(opcode), payload.n);

    return this->m_stream->stream_send(fmt);
  }

void
WebSocket_Dispatcher::
do_close_nolock(const char* why)
  {
    if(this->m_state.xchg(ws_dispatcher_closed) == ws_dispatcher_closed)
      return;

    TRITON_LOG_DEBUG(("WebSocket connection `$1` closed: $2"), this, why);
    this->m_stream->stream_shut_down();
  }

void
WebSocket_Dispatcher::
do_release_inbound() noexcept
  {
    plain_mutex::unique_lock lock(this->m_inbound_mutex);
    this->m_assembler.deallocate();
  }

void
WebSocket_Dispatcher::
do_push_message(WebSocket_Message&& msg)
  {
    plain_mutex::unique_lock lock(this->m_queue_mutex);
    this->m_queue.push_back(move(msg));

    // If the application does not take messages fast enough, stop reading.
    if(!this->m_throttled && (this->m_queue.size() >= this->m_max_inbound_messages)) {
      this->m_throttled = true;
      this->m_stream->stream_throttle(true);
    }
  }

void
WebSocket_Dispatcher::
do_on_close_frame(const opt<WebSocket_Close_Reason>& reason)
  {
    plain_mutex::unique_lock lock(this->m_send_mutex);

    switch(this->m_state.load())
      {
      case ws_dispatcher_open:
        {
          this->m_state.store(ws_dispatcher_closing_remote);
          TRITON_LOG_DEBUG(("WebSocket connection `$1` closing by peer"), this);

          // Echo the status code. Codes that are not allowed on the wire are
          // replaced with `1000`.
          WebSocket_Close_Reason reply;
          if(reason && is_websocket_status_sendable(reason->code))
            reply.code = reason->code;

          tinyfmt_str fmt;
          reply.encode(fmt);
          this->do_send_frame_nolock(ws_CLOSE, true, fmt);
          this->do_close_nolock("CLOSE received and echoed");
        }
        break;

      case ws_dispatcher_closing_local:
        this->do_close_nolock("CLOSE acknowledged by peer");
        break;

      default:
        break;
      }
  }

void
WebSocket_Dispatcher::
do_fail(const WebSocket_Error& err)
  {
    WebSocket_Close_Reason reason(err.close_status(), err.to_string());
    TRITON_LOG_WARN(("WebSocket connection `$1` failed: $2"), this, err);

    plain_mutex::unique_lock lock(this->m_send_mutex);
    auto state = this->m_state.load();
    if(state == ws_dispatcher_closed)
      return;

    // Try notifying the peer. A broken stream cannot carry a CLOSE frame.
    if((state == ws_dispatcher_open) && (err.code() != ws_error_io)) {
      tinyfmt_str fmt;
      reason.encode(fmt);
      this->do_send_frame_nolock(ws_CLOSE, true, fmt);
    }

    this->do_close_nolock("protocol error");
    lock.unlock();

    this->do_release_inbound();
    this->do_push_message(WebSocket_Message::Close{ move(reason) });
  }

WebSocket_Dispatcher::Stats
WebSocket_Dispatcher::
stats() const noexcept
  {
    Stats st;
    st.frames_in = this->m_frames_in.load();
    st.bytes_in = this->m_bytes_in.load();
    st.frames_out = this->m_frames_out.load();
    st.bytes_out = this->m_bytes_out.load();
    return st;
  }

void
WebSocket_Dispatcher::
on_stream_data(linear_buffer& data, bool eof)
  {
    for(;;) {
      plain_mutex::unique_lock inbound_lock(this->m_inbound_mutex);

      // If the connection has been closed, ignore further incoming data.
      if(this->m_state.load() == ws_dispatcher_closed) {
        this->m_assembler.deallocate();
        data.clear();
        return;
      }

      opt<WebSocket_Frame> frame;
      auto err = this->m_parser.parse_frame_from_stream(frame, data);
      if(err) {
        inbound_lock.unlock();
        data.clear();
        this->do_fail(err);
        return;
      }

      if(!frame)
        break;

      this->m_frames_in.xadd(1);
      this->m_bytes_in.xadd(frame->payload.size());

      WebSocket_Message msg;
      err = this->m_assembler.accept_frame(msg, move(*frame));
      inbound_lock.unlock();
      if(err) {
        data.clear();
        this->do_fail(err);
        return;
      }

      switch(msg.kind())
        {
        case ws_message_nop:
          break;

        case ws_message_ping:
          if(this->m_auto_pong) {
            plain_mutex::unique_lock lock(this->m_send_mutex);
            if(this->m_state.load() == ws_dispatcher_open)
              this->do_send_frame_nolock(ws_PONG, true, msg.as_ping());
          }
          this->do_push_message(move(msg));
          break;

        case ws_message_close:
          // Messages after CLOSE are never delivered. Fragments of an
          // unfinished message are discarded.
          this->do_on_close_frame(msg.as_close());
          this->do_release_inbound();
          this->do_push_message(move(msg));
          data.clear();
          return;

        default:
          this->do_push_message(move(msg));
          break;
        }
    }

    if(eof)
      this->on_stream_closed(0);
  }

void
WebSocket_Dispatcher::
on_stream_closed(int err)
  {
    if(err != 0) {
      this->do_fail(WebSocket_Error(ws_error_io, static_cast<uint32_t>(err)));
      return;
    }

    plain_mutex::unique_lock lock(this->m_send_mutex);
    if(this->m_state.load() == ws_dispatcher_closed)
      return;

    this->do_close_nolock("stream closed without a CLOSE frame");
    lock.unlock();

    this->do_release_inbound();
    this->do_push_message(WebSocket_Message::Close{
          WebSocket_Close_Reason(ws_status_no_close_frame, sref("Connection closed without a CLOSE frame")) });
  }

bool
WebSocket_Dispatcher::
check_close_timeout(steady_time now)
  {
    plain_mutex::unique_lock lock(this->m_send_mutex);
    if(this->m_state.load() != ws_dispatcher_closing_local)
      return false;

    if(now < this->m_close_deadline)
      return false;

    this->do_close_nolock("CLOSE reply timed out");
    lock.unlock();

    this->do_release_inbound();
    this->do_push_message(WebSocket_Message::Close{
          WebSocket_Close_Reason(ws_status_no_close_frame, sref("CLOSE reply timed out")) });
    return true;
  }

bool
WebSocket_Dispatcher::
next_message(WebSocket_Message& msg)
  {
    plain_mutex::unique_lock lock(this->m_queue_mutex);
    if(this->m_queue.empty())
      return false;

    msg = move(this->m_queue.front());
    this->m_queue.pop_front();

    // Resume reading when half of the queue has been drained.
    if(this->m_throttled && (this->m_queue.size() <= this->m_max_inbound_messages / 2)) {
      this->m_throttled = false;
      this->m_stream->stream_throttle(false);
    }
    return true;
  }

opt<WebSocket_Message>
WebSocket_Dispatcher::
next_message()
  {
    opt<WebSocket_Message> msg;
    if(!this->next_message(msg.emplace()))
      msg.reset();
    return msg;
  }

bool
WebSocket_Dispatcher::
finished() const noexcept
  {
    plain_mutex::unique_lock lock(this->m_queue_mutex);
    return (this->m_state.load() == ws_dispatcher_closed) && this->m_queue.empty();
  }

bool
WebSocket_Dispatcher::
send(const WebSocket_Message& msg)
  {
    if(msg.is_close())
      return this->shut_down(msg.as_close());

    plain_mutex::unique_lock lock(this->m_send_mutex);
    auto state = this->m_state.load();
    if(state == ws_dispatcher_closed)
      TRITON_THROW(("WebSocket connection `$1` closed"), this);

    if(msg.is_nop())
      return true;

    if(state != ws_dispatcher_open)
      TRITON_THROW(("WebSocket connection `$1` closing; no more messages allowed"), this);

    switch(msg.kind())
      {
      case ws_message_text:
      case ws_message_binary:
        if(this->m_out_active)
          TRITON_THROW((
              "Could not send WebSocket message: $1"),
              WebSocket_Error(ws_error_continuation_started));

        return this->do_send_frame_nolock(msg.opcode(), true, msg.payload());

      case ws_message_continuation:
        {
          const auto& alt = msg.as_continuation();
          switch(alt.fragment)
            {
            case ws_fragment_first_text:
            case ws_fragment_first_binary:
              if(this->m_out_active)
                TRITON_THROW((
                    "Could not send WebSocket message: $1"),
                    WebSocket_Error(ws_error_continuation_started));

              this->m_out_active = true;
              return this->do_send_frame_nolock(msg.opcode(), false, alt.data);

            case ws_fragment_continue:
            case ws_fragment_last:
              if(!this->m_out_active)
                TRITON_THROW((
                    "Could not send WebSocket message: $1"),
                    WebSocket_Error(ws_error_continuation_not_started));

              this->m_out_active = alt.fragment != ws_fragment_last;
              return this->do_send_frame_nolock(ws_CONTINUATION, !this->m_out_active, alt.data);

            default:
              TRITON_THROW((
                  "Could not send WebSocket message: $1"),
                  WebSocket_Error(ws_error_continuation_fragment, alt.fragment));
            }
        }

      case ws_message_ping:
      case ws_message_pong:
        if(msg.payload().n > 125)
          TRITON_THROW((
              "Could not send WebSocket message: $1"),
              WebSocket_Error(ws_error_invalid_length, msg.payload().n));

        return this->do_send_frame_nolock(msg.opcode(), true, msg.payload());

      default:
        TRITON_THROW(("Unknown WebSocket message kind `$1`"), static_cast<uint32_t>(msg.kind()));
      }
  }

bool
WebSocket_Dispatcher::
send_text(chars_view data)
  {
    return this->send(WebSocket_Message::Text{ cow_string(data.p, data.n) });
  }

bool
WebSocket_Dispatcher::
send_binary(chars_view data)
  {
    return this->send(WebSocket_Message::Binary{ cow_string(data.p, data.n) });
  }

bool
WebSocket_Dispatcher::
ping(chars_view data)
  {
    return this->send(WebSocket_Message::Ping{ cow_string(data.p, data.n) });
  }

bool
WebSocket_Dispatcher::
shut_down(const opt<WebSocket_Close_Reason>& reason)
  {
    if(reason && !is_websocket_status_sendable(reason->code))
      TRITON_THROW(("WebSocket status `$1` not allowed in CLOSE frames"),
                   static_cast<uint32_t>(reason->code));

    plain_mutex::unique_lock lock(this->m_send_mutex);
    if(this->m_state.load() != ws_dispatcher_open)
      return false;

    this->m_state.store(ws_dispatcher_closing_local);
    this->m_close_deadline = steady_clock::now() + this->m_close_timeout;
    TRITON_LOG_DEBUG(("WebSocket connection `$1` closing"), this);

    // The payload is empty if no reason is given.
    tinyfmt_str fmt;
    if(reason)
      reason->encode(fmt);
    return this->do_send_frame_nolock(ws_CLOSE, true, fmt);
  }

}  // namespace triton
