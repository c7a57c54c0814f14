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
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <type_traits>

namespace fedmint::util {

// Integral types other than bool.
template <typename T>
using isEndianConvertible = std::conjunction<std::is_integral<T>, std::negation<std::is_same<T, bool>>>;

// Writes `v` most significant byte first into `out`, which must hold sizeof(T) bytes.
template <typename T>
void writeBigEndian(T v, std::uint8_t* out) {
  static_assert(isEndianConvertible<T>::value);
  using U = std::make_unsigned_t<T>;
  auto u = static_cast<U>(v);
  for (auto i = sizeof(T); i > 0; --i) {
    out[i - 1] = static_cast<std::uint8_t>(u & 0xff);
    u = static_cast<U>(u >> 8);
  }
}

template <typename T>
std::array<std::uint8_t, sizeof(T)> toBigEndianArrayBuffer(T v) {
  std::array<std::uint8_t, sizeof(T)> ret;
  writeBigEndian(v, ret.data());
  return ret;
}

template <typename T>
std::string toBigEndianStringBuffer(T v) {
  const auto bytes = toBigEndianArrayBuffer(v);
  return std::string(bytes.begin(), bytes.end());
}

// Buffer must be at least sizeof(T) bytes long.
template <typename T>
T fromBigEndianBuffer(const void* buf) {
  static_assert(isEndianConvertible<T>::value);
  using U = std::make_unsigned_t<T>;
  const auto* p = static_cast<const std::uint8_t*>(buf);
  U u = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    u = static_cast<U>((u << 8) | p[i]);
  }
  return static_cast<T>(u);
}

}  // namespace fedmint::util
