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

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace fedmint::util {

/**
 * Cryptographically secure random source backed by the OpenSSL RAND_bytes CSPRNG.
 *
 * Satisfies UniformRandomBitGenerator, so it can drive std::shuffle and the standard distributions as well as the
 * key and blinding factor generation. Instances hold no state; every call draws from the OpenSSL generator.
 */
class SecureRandom {
 public:
  using result_type = std::uint64_t;

  static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
  static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

  result_type operator()();

  // Fill `len` bytes at `out`. Throws RandomnessException if the generator is not seeded.
  void fill(std::uint8_t* out, size_t len);

  std::vector<std::uint8_t> bytes(size_t len) {
    std::vector<std::uint8_t> out(len);
    fill(out.data(), out.size());
    return out;
  }
};

class RandomnessException : public std::runtime_error {
 public:
  explicit RandomnessException(const std::string& what) : std::runtime_error(what) {}
};

// Marks generators fit for key material. Only SecureRandom qualifies; tests may opt in a seeded engine by
// specializing this for it.
template <typename Rng>
struct is_crypto_rng : std::false_type {};

template <>
struct is_crypto_rng<SecureRandom> : std::true_type {};

template <typename Rng>
inline constexpr bool is_crypto_rng_v = is_crypto_rng<Rng>::value;

// Fill a buffer from any UniformRandomBitGenerator. Used where callers supply their own random source.
template <typename Rng>
void fillRandom(Rng& rng, std::uint8_t* out, size_t len) {
  if constexpr (std::is_same_v<Rng, SecureRandom>) {
    rng.fill(out, len);
  } else {
    for (size_t i = 0; i < len; ++i) {
      out[i] = static_cast<std::uint8_t>(rng() & 0xFF);
    }
  }
}

}  // namespace fedmint::util
