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

#include "tbs/BlindSignatures.h"

#include <stdexcept>

#include "Logger.hpp"
#include "sha_hash.hpp"

namespace fedmint::tbs {

namespace detail {

BNT scalarFromWideBytes(const std::vector<uint8_t>& bytes) {
  BNT s;
  s.fromBytes(bytes.data(), static_cast<int>(bytes.size()));
  s.SlowModulo(Library::Get().getGroupOrder());
  return s;
}

std::vector<uint8_t> scalarToBytes(const BNT& s) {
  std::vector<uint8_t> buf(static_cast<size_t>(Library::Get().getScalarSize()));
  s.toBytes(buf.data(), static_cast<int>(buf.size()));
  return buf;
}

BNT scalarFromBytes(const uint8_t* data, size_t len) {
  const auto& lib = Library::Get();
  if (len != static_cast<size_t>(lib.getScalarSize())) {
    throw std::invalid_argument("Scalar must be " + std::to_string(lib.getScalarSize()) + " bytes, got " +
                                std::to_string(len));
  }
  BNT s;
  s.fromBytes(data, static_cast<int>(len));
  if (s.isZero() || s >= lib.getGroupOrder()) {
    throw std::invalid_argument("Scalar out of range");
  }
  return s;
}

}  // namespace detail

Message hashToMessage(const uint8_t* data, size_t len) {
  auto digest = util::SHA2_256{}.digest(data, len);
  return Message(G1T::Map(digest.data(), static_cast<int>(digest.size())));
}

BlindedMessage blindWithKey(const Message& msg, const BlindingKey& key) {
  return BlindedMessage(G1T::Times(msg.point(), key.scalar()));
}

BlindedSignature signBlindedMessage(const BlindedMessage& msg, const SecretKey& sk) {
  return BlindedSignature(G1T::Times(msg.point(), sk.scalar()));
}

Signature unblindSignature(const BlindingKey& key, const BlindedSignature& sig) {
  const auto inv = key.scalar().invertModPrime(Library::Get().getGroupOrder());
  return Signature(G1T::Times(sig.point(), inv));
}

bool verify(const Message& msg, const Signature& sig, const AggregatePublicKey& pk) {
  if (sig.point().isInfinity()) {
    LOG_DEBUG(TBS_LOG, "Rejecting signature at infinity");
    return false;
  }
  return GTT::Pairing(sig.point(), G2T::Generator()) == GTT::Pairing(msg.point(), pk.point());
}

}  // namespace fedmint::tbs
