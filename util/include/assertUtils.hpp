// Fedmint
//
// Copyright (c) 2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

// Invariant checks for conditions that can only fail because of a programming error. A failed check logs the
// expression and a backtrace, then terminates. Recoverable conditions are reported with exceptions instead.

#pragma once

#include <cxxabi.h>
#include <execinfo.h>

#include <cstdlib>
#include <exception>
#include <sstream>

#include "Logger.hpp"

inline void printCallStack() {
  const int MAX_FRAMES = 64;
  void* addrlist[MAX_FRAMES];
  int addrLen = backtrace(addrlist, MAX_FRAMES);
  if (addrLen <= 0) return;
  char** symbolsList = backtrace_symbols(addrlist, addrLen);
  if (!symbolsList) return;
  std::ostringstream os;
  // Skip the first frame, it is this function.
  for (int i = 1; i < addrLen; i++) {
    char *beginName = nullptr, *beginOffset = nullptr, *endOffset = nullptr;
    for (char* ptr = symbolsList[i]; *ptr; ++ptr) {
      if (*ptr == '(')
        beginName = ptr;
      else if (*ptr == '+')
        beginOffset = ptr;
      else if (*ptr == ')' && beginOffset) {
        endOffset = ptr;
        break;
      }
    }
    if (beginName && beginOffset && endOffset && beginName < beginOffset) {
      *beginName++ = '\0';
      *beginOffset++ = '\0';
      *endOffset = '\0';
      int status;
      char* demangled = abi::__cxa_demangle(beginName, nullptr, nullptr, &status);
      os << " [bt] " << (status == 0 ? demangled : beginName) << "+" << beginOffset << std::endl;
      std::free(demangled);
    } else {
      os << " [bt] " << symbolsList[i] << std::endl;
    }
  }
  LOG_FATAL(GL, "\n" << os.str());
  std::free(symbolsList);
}

#define FEDMINT_ASSERT_FAIL(description)                                                                      \
  {                                                                                                           \
    LOG_FATAL(GL, description << " in function " << __FUNCTION__ << " (" << __FILE__ << " " << __LINE__ << ")"); \
    printCallStack();                                                                                         \
    std::terminate();                                                                                         \
  }

#define FedmintAssert(expr)                                                      \
  {                                                                              \
    if ((expr) != true) FEDMINT_ASSERT_FAIL("Assert: expression '" #expr "' is false"); \
  }

#define FEDMINT_ASSERT_BINARY(expr1, expr2, op, name)                                                         \
  {                                                                                                           \
    if (!((expr1)op(expr2)))                                                                                  \
      FEDMINT_ASSERT_FAIL(name ": " #expr1 " = " << (expr1) << ", " #expr2 " = " << (expr2));               \
  }

// Assert (expr1 == expr2)
#define FedmintAssertEQ(expr1, expr2) FEDMINT_ASSERT_BINARY(expr1, expr2, ==, "AssertEQ")
// Assert (expr1 != expr2)
#define FedmintAssertNE(expr1, expr2) FEDMINT_ASSERT_BINARY(expr1, expr2, !=, "AssertNE")
// Assert (expr1 >= expr2)
#define FedmintAssertGE(expr1, expr2) FEDMINT_ASSERT_BINARY(expr1, expr2, >=, "AssertGE")
// Assert (expr1 > expr2)
#define FedmintAssertGT(expr1, expr2) FEDMINT_ASSERT_BINARY(expr1, expr2, >, "AssertGT")
// Assert (expr1 < expr2)
#define FedmintAssertLT(expr1, expr2) FEDMINT_ASSERT_BINARY(expr1, expr2, <, "AssertLT")
// Assert (expr1 <= expr2)
#define FedmintAssertLE(expr1, expr2) FEDMINT_ASSERT_BINARY(expr1, expr2, <=, "AssertLE")
