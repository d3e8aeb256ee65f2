// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../triton/http/http_field_name.hpp"
using namespace ::triton;

int
main()
  {
    HTTP_Field_Name n1, n2;
    TRITON_TEST_CHECK(n1.empty());
    TRITON_TEST_CHECK(n1 == "");
    TRITON_TEST_CHECK(n1 == n2);
    TRITON_TEST_CHECK(n1.rdhash() == n2.rdhash());

    n1 = sref("Sec-WebSocket-Key");
    TRITON_TEST_CHECK(n1.size() == 17);
    TRITON_TEST_CHECK(n1 == "sec-websocket-key");
    TRITON_TEST_CHECK(n1 == "SEC-WEBSOCKET-KEY");
    TRITON_TEST_CHECK(n1 != "Sec-WebSocket-Keys");
    TRITON_TEST_CHECK(n1 != n2);

    n2 = cow_string("SEC-websocket-KEY");
    TRITON_TEST_CHECK(n1 == n2);
    TRITON_TEST_CHECK(n1 == n2.str());
    TRITON_TEST_CHECK(n1.rdhash() == n2.rdhash());
    TRITON_TEST_CHECK(n1.compare("sec-websocket-key") == 0);
    TRITON_TEST_CHECK(n1.compare("sec-websocket-version") < 0);
    TRITON_TEST_CHECK(n1.compare("Sec-WebSocket-Accept") > 0);

    // Only the case of letters is ignored.
    n2 = sref("Sec_WebSocket_Key");
    TRITON_TEST_CHECK(n1 != n2);
    n2.canonicalize();
    TRITON_TEST_CHECK(n2.str() == "sec_websocket_key");

    n1.canonicalize();
    TRITON_TEST_CHECK(n1.str() == "sec-websocket-key");

    // Names are HTTP tokens.
    n1 = sref("Bad Name");
    TRITON_TEST_CHECK_CATCH(n1.canonicalize());
    n1 = sref("Bad:Name");
    TRITON_TEST_CHECK_CATCH(n1.canonicalize());
    n1 = sref("X-Custom.Header~1");
    n1.canonicalize();
    TRITON_TEST_CHECK(n1.str() == "x-custom.header~1");
    n1.clear();
    TRITON_TEST_CHECK_CATCH(n1.canonicalize());

    n1.append("Upgr", 4).append("ade", 3);
    TRITON_TEST_CHECK(n1 == "upgrade");

    tinyfmt_str fmt;
    fmt << n1;
    TRITON_TEST_CHECK(fmt.get_string() == "Upgrade");
  }
