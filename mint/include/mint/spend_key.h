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

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "secure_random.hpp"

namespace fedmint::mint {

// The one-time Ed25519 key that owns a coin. Its raw public key is the coin's nonce.
class SpendKey {
 public:
  static constexpr const size_t KeyByteSize = 32;
  static constexpr const size_t SignatureByteSize = 64;
  using PrivateKeyBytes = std::array<uint8_t, KeyByteSize>;
  using PublicKeyBytes = std::array<uint8_t, KeyByteSize>;

  template <typename Rng>
  static SpendKey random(Rng& rng) {
    SpendKey key;
    util::fillRandom(rng, key.bytes_.data(), key.bytes_.size());
    return key;
  }

  // Throws std::invalid_argument unless `bytes` holds exactly KeyByteSize bytes.
  static SpendKey fromBytes(const std::vector<uint8_t>& bytes);

  const PrivateKeyBytes& bytes() const { return bytes_; }

  PublicKeyBytes publicKey() const;

  std::vector<uint8_t> sign(const uint8_t* msg, size_t len) const;
  std::vector<uint8_t> sign(const std::string& msg) const {
    return sign(reinterpret_cast<const uint8_t*>(msg.data()), msg.size());
  }

  static bool verify(const PublicKeyBytes& pub, const uint8_t* msg, size_t len, const uint8_t* sig, size_t sigLen);

  bool operator==(const SpendKey& other) const { return bytes_ == other.bytes_; }

 private:
  SpendKey() = default;

  PrivateKeyBytes bytes_;
};

}  // namespace fedmint::mint
