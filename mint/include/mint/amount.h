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

#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace fedmint::mint {

// A quantity in milli-satoshi. As a coin's value it names the denomination tier.
struct Amount {
  uint64_t milli_sat{0};

  constexpr Amount() = default;
  constexpr explicit Amount(uint64_t msat) : milli_sat(msat) {}

  bool isZero() const { return milli_sat == 0; }

  // Addition and multiplication throw std::overflow_error instead of wrapping.
  Amount operator+(Amount other) const {
    if (other.milli_sat > std::numeric_limits<uint64_t>::max() - milli_sat) {
      throw std::overflow_error("amount addition overflows");
    }
    return Amount(milli_sat + other.milli_sat);
  }
  Amount& operator+=(Amount other) {
    *this = *this + other;
    return *this;
  }
  Amount operator-(Amount other) const {
    if (other.milli_sat > milli_sat) {
      throw std::underflow_error("amount subtraction below zero");
    }
    return Amount(milli_sat - other.milli_sat);
  }
  Amount& operator-=(Amount other) {
    *this = *this - other;
    return *this;
  }
  Amount operator*(uint64_t count) const {
    if (count != 0 && milli_sat > std::numeric_limits<uint64_t>::max() / count) {
      throw std::overflow_error("amount multiplication overflows");
    }
    return Amount(milli_sat * count);
  }
  // How many whole `other` fit in this amount.
  uint64_t operator/(Amount other) const { return milli_sat / other.milli_sat; }
  Amount operator%(Amount other) const { return Amount(milli_sat % other.milli_sat); }

  bool operator==(Amount other) const { return milli_sat == other.milli_sat; }
  bool operator!=(Amount other) const { return milli_sat != other.milli_sat; }
  bool operator<(Amount other) const { return milli_sat < other.milli_sat; }
  bool operator<=(Amount other) const { return milli_sat <= other.milli_sat; }
  bool operator>(Amount other) const { return milli_sat > other.milli_sat; }
  bool operator>=(Amount other) const { return milli_sat >= other.milli_sat; }
};

inline std::ostream& operator<<(std::ostream& os, Amount a) { return os << a.milli_sat << " msat"; }

}  // namespace fedmint::mint

namespace std {
template <>
struct hash<fedmint::mint::Amount> {
  std::size_t operator()(fedmint::mint::Amount a) const noexcept { return std::hash<uint64_t>{}(a.milli_sat); }
};
}  // namespace std
