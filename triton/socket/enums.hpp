// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_SOCKET_ENUMS_
#define TRITON_SOCKET_ENUMS_

#include "../fwd.hpp"
namespace triton {

enum Socket_State : uint8_t
  {
    socket_established  = 1,
    socket_closing      = 2,
    socket_closed       = 3,
  };

// States only go forward.
enum WS_Dispatcher_State : uint8_t
  {
    ws_dispatcher_open            = 0,
    ws_dispatcher_closing_local   = 1,  // CLOSE sent; awaiting reply
    ws_dispatcher_closing_remote  = 2,  // CLOSE received; replying
    ws_dispatcher_closed          = 3,
  };

}  // namespace triton
#endif
