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

// Blind BLS signatures over RELIC's pairing groups.
//
// A message is hashed to a point M in G1. The holder blinds it as B = r*M with a random scalar r and sends B to the
// signer, who returns sk*B. Multiplying by r^-1 yields S = sk*M, an ordinary BLS signature that verifies as
// e(S, g2) == e(M, pk) while the signer never saw M.

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "Library.h"
#include "RelicTypes.h"
#include "secure_random.hpp"

namespace fedmint::tbs {

namespace detail {

// Reduces a wide random buffer modulo the group order. Returns zero if the result is zero.
BNT scalarFromWideBytes(const std::vector<uint8_t>& bytes);

template <typename Rng>
BNT randomScalar(Rng& rng) {
  // Drawing 16 extra bytes makes the modular bias negligible.
  std::vector<uint8_t> buf(static_cast<size_t>(Library::Get().getScalarSize()) + 16);
  while (true) {
    util::fillRandom(rng, buf.data(), buf.size());
    auto s = scalarFromWideBytes(buf);
    if (!s.isZero()) return s;
  }
}

// A scalar in [1, q) serialized as fixed-length big-endian bytes.
std::vector<uint8_t> scalarToBytes(const BNT& s);
BNT scalarFromBytes(const uint8_t* data, size_t len);

}  // namespace detail

// A G1 point with a distinct role. The tag keeps blinded and unblinded values from being mixed up.
template <typename Tag>
class G1Element {
 public:
  G1Element() = default;
  explicit G1Element(G1T point) : point_(std::move(point)) {}

  const G1T& point() const { return point_; }

  std::vector<uint8_t> toBytes() const { return point_.toBytes(); }

  // Throws std::invalid_argument on a malformed point.
  static G1Element fromBytes(const uint8_t* data, size_t len) {
    G1T p;
    p.fromBytes(data, static_cast<int>(len));
    return G1Element(std::move(p));
  }
  static G1Element fromBytes(const std::vector<uint8_t>& bytes) { return fromBytes(bytes.data(), bytes.size()); }

  bool operator==(const G1Element& other) const { return point_ == other.point_; }
  bool operator!=(const G1Element& other) const { return point_ != other.point_; }

 private:
  G1T point_;
};

using Message = G1Element<struct MessageTag>;
using BlindedMessage = G1Element<struct BlindedMessageTag>;
using BlindedSignature = G1Element<struct BlindedSignatureTag>;
using Signature = G1Element<struct SignatureTag>;

// Hashes arbitrary bytes to the message point: g1_map(SHA-256(data)).
Message hashToMessage(const uint8_t* data, size_t len);

class BlindingKey {
 public:
  template <typename Rng>
  static BlindingKey random(Rng& rng) {
    return BlindingKey(detail::randomScalar(rng));
  }

  std::vector<uint8_t> toBytes() const { return detail::scalarToBytes(r_); }
  static BlindingKey fromBytes(const std::vector<uint8_t>& bytes) {
    return BlindingKey(detail::scalarFromBytes(bytes.data(), bytes.size()));
  }

  const BNT& scalar() const { return r_; }

  bool operator==(const BlindingKey& other) const { return r_ == other.r_; }

 private:
  explicit BlindingKey(BNT r) : r_(std::move(r)) {}

  BNT r_;
};

class PublicKey {
 public:
  PublicKey() = default;
  explicit PublicKey(G2T point) : point_(std::move(point)) {}

  const G2T& point() const { return point_; }

  std::vector<uint8_t> toBytes() const { return point_.toBytes(); }
  static PublicKey fromBytes(const std::vector<uint8_t>& bytes) {
    G2T p;
    p.fromBytes(bytes.data(), static_cast<int>(bytes.size()));
    return PublicKey(std::move(p));
  }

  bool operator==(const PublicKey& other) const { return point_ == other.point_; }
  bool operator!=(const PublicKey& other) const { return point_ != other.point_; }

 private:
  G2T point_;
};

// The federation's combined key for one tier. Verification is the same as for a single signer.
using AggregatePublicKey = PublicKey;

class SecretKey {
 public:
  template <typename Rng>
  static SecretKey random(Rng& rng) {
    return SecretKey(detail::randomScalar(rng));
  }

  PublicKey toPublicKey() const { return PublicKey(G2T::Times(G2T::Generator(), x_)); }

  std::vector<uint8_t> toBytes() const { return detail::scalarToBytes(x_); }
  static SecretKey fromBytes(const std::vector<uint8_t>& bytes) {
    return SecretKey(detail::scalarFromBytes(bytes.data(), bytes.size()));
  }

  const BNT& scalar() const { return x_; }

 private:
  explicit SecretKey(BNT x) : x_(std::move(x)) {}

  BNT x_;
};

BlindedMessage blindWithKey(const Message& msg, const BlindingKey& key);

template <typename Rng>
std::pair<BlindingKey, BlindedMessage> blindMessage(const Message& msg, Rng& rng) {
  auto key = BlindingKey::random(rng);
  auto blinded = blindWithKey(msg, key);
  return {std::move(key), std::move(blinded)};
}

BlindedSignature signBlindedMessage(const BlindedMessage& msg, const SecretKey& sk);

Signature unblindSignature(const BlindingKey& key, const BlindedSignature& sig);

bool verify(const Message& msg, const Signature& sig, const AggregatePublicKey& pk);

}  // namespace fedmint::tbs
