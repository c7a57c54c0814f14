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

#include "tbs/Library.h"

#include <stdexcept>

#include "Logger.hpp"

namespace fedmint::tbs {

LibraryInitializer::LibraryInitializer() {
  if (core_init() != STS_OK) {
    core_clean();
    throw std::runtime_error("Could not initialize RELIC elliptic curve library");
  }

  if (pc_param_set_any() != STS_OK) {
    LOG_ERROR(TBS_LOG, "Couldn't set up RELIC elliptic curve");
    throw std::runtime_error("Could not set up RELIC elliptic curve library");
  }
}

LibraryInitializer::~LibraryInitializer() { core_clean(); }

Library::Library() {
  G1T dummyG1 = G1T::Map(reinterpret_cast<const unsigned char*>("fedmint"), 7);
  numBytesG1 = dummyG1.getByteCount();

  G2T dummyG2 = G2T::Generator();
  numBytesG2 = dummyG2.getByteCount();

  g2_get_ord(groupOrder);
  numBytesScalar = groupOrder.getByteCount();

  LOG_INFO(TBS_LOG,
           "Initialized RELIC, curve " << getCurrentCurveName() << ", G1 point " << numBytesG1 << " bytes, G2 point "
                                       << numBytesG2 << " bytes");
}

std::string Library::getCurrentCurveName() const {
  switch (ep_param_get()) {
    case BN_P254:
      return "BN-P254";
    case BN_P256:
      return "BN-P256";
    case B12_P381:
      return "B12-P381";
    case BN_P382:
      return "BN-P382";
    case B12_P455:
      return "B12-P455";
    case BN_P638:
      return "BN-P638";
    case B12_P638:
      return "B12-P638";
    default:
      return "curve#" + std::to_string(ep_param_get());
  }
}

}  // namespace fedmint::tbs
