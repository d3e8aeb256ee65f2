// This file is part of Triton.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef TRITON_TEST_UTILS_
#define TRITON_TEST_UTILS_

#include "../triton/xprecompiled.hpp"
#include "../triton/fwd.hpp"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define TRITON_TEST_CHECK(expr)  \
    do  \
      try {  \
        if(static_cast<bool>(expr) == false) {  \
          /* failure */  \
          ::fprintf(stderr,  \
              "%s:%d: TRITON_TEST_CHECK FAIL: %s\n",  \
              __FILE__, __LINE__, #expr);  \
          ::abort();  \
        }  \
        /* success */  \
      }  \
      catch(::std::exception& stdex) {  \
        /* failure */  \
        ::fprintf(stderr,  \
            "%s:%d: TRITON_TEST_CHECK XFAIL: %s\n  %s\n",  \
            __FILE__, __LINE__, #expr, stdex.what());  \
        ::abort();  \
      }  \
    while(false)  // no semicolon

#define TRITON_TEST_CHECK_CATCH(expr)  \
    do  \
      try {  \
        static_cast<void>(expr);  \
        /* failure */  \
        ::fprintf(stderr,  \
            "%s:%d: TRITON_TEST_CHECK_CATCH XPASS: %s\n",  \
            __FILE__, __LINE__, #expr);  \
        ::abort();  \
      }  \
      catch(::std::exception& stdex) {  \
        /* success */  \
        ::fprintf(stderr,  \
            "%s:%d: TRITON_TEST_CHECK_CATCH caught: %s\n",  \
            __FILE__, __LINE__, stdex.what());  \
      }  \
    while(false)  // no semicolon

#endif
