// Fedmint
//
// Copyright (c) 2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "mintclient/exception.h"

namespace fedmint::client {

// Quorum sizes for a federation of `mint_count` mints tolerating `f` faulty ones. When `f` is not configured it is
// the largest value with 3f + 1 <= mint_count.
class QuorumConverter {
 public:
  QuorumConverter(size_t mint_count, std::optional<uint16_t> f_val) : mint_count_(mint_count) {
    if (mint_count == 0) {
      throw ConfigurationException("a federation needs at least one mint");
    }
    f_val_ = f_val ? *f_val : static_cast<uint16_t>((mint_count - 1) / 3);
  }

  // F + 1 acceptances, so that at least one honest mint saw the request. Capped at the number of mints.
  size_t byzantineSafeQuorum() const { return std::min<size_t>(static_cast<size_t>(f_val_) + 1, mint_count_); }

 private:
  size_t mint_count_;
  uint16_t f_val_;
};

}  // namespace fedmint::client
