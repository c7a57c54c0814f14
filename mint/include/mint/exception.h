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

#include <sstream>
#include <stdexcept>
#include <string>

#include "mint/amount.h"

namespace fedmint::mint {

// A tier is missing from a key table, or an amount cannot be made from the available tiers.
class InvalidAmountTierException : public std::runtime_error {
 public:
  explicit InvalidAmountTierException(Amount amount) : std::runtime_error(message(amount)), amount_(amount) {}

  Amount amount() const { return amount_; }

 private:
  static std::string message(Amount amount) {
    std::ostringstream oss;
    oss << "Invalid amount tier: " << amount;
    return oss.str();
  }

  Amount amount_;
};

}  // namespace fedmint::mint
