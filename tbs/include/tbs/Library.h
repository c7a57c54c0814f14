// Fedmint
//
// Copyright (c) 2018-2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#pragma once

#include "Relic.h"
#include "RelicTypes.h"

#include <string>

namespace fedmint::tbs {

class LibraryInitializer {
 public:
  LibraryInitializer();
  ~LibraryInitializer();
};

/**
 * Process-wide RELIC state. The first call to Get() initializes the library on the calling thread and selects the
 * default pairing-friendly curve. All group arithmetic must happen on that thread.
 */
class Library {
 public:
  static Library* GetPtr() {
    static Library* lib = new Library();
    return lib;
  }

  static const Library& Get() { return *Library::GetPtr(); }

 public:
  std::string getCurrentCurveName() const;

  int getG1PointSize() const { return numBytesG1; }

  int getG2PointSize() const { return numBytesG2; }

  // Order q of G1, G2 and GT.
  const BNT& getGroupOrder() const { return groupOrder; }

  // Byte length of a serialized scalar mod q.
  int getScalarSize() const { return numBytesScalar; }

 private:
  Library();

 private:
  LibraryInitializer li;
  BNT groupOrder;
  int numBytesG1, numBytesG2, numBytesScalar;
};

}  // namespace fedmint::tbs
