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

#include "mintclient/db_keys.h"

#include <algorithm>
#include <string>

#include "endianness.hpp"
#include "mintclient/exception.h"

namespace fedmint::client {

using util::Sliver;

namespace {

constexpr size_t kPendingKeySize = 1 + mint::TransactionId::SIZE;
constexpr size_t kCoinKeyMinSize = 1 + sizeof(uint64_t);

void checkPrefix(const Sliver& key, DbKeyPrefix expected) {
  const auto got = static_cast<uint8_t>(key[0]);
  if (got != static_cast<uint8_t>(expected)) {
    throw DecodingError(DecodingError::Kind::WrongPrefix,
                        "expected key prefix " + std::to_string(static_cast<int>(expected)) + ", got " +
                            std::to_string(static_cast<int>(got)));
  }
}

}  // namespace

Sliver PendingIssuanceKey::encode() const {
  std::string out;
  out.reserve(kPendingKeySize);
  out.push_back(static_cast<char>(DbKeyPrefix::PendingIssuance));
  out.append(id.bytes().begin(), id.bytes().end());
  return Sliver(std::move(out));
}

PendingIssuanceKey PendingIssuanceKey::decode(const Sliver& key) {
  if (key.length() != kPendingKeySize) {
    throw DecodingError(DecodingError::Kind::WrongLength,
                        "pending issuance key must be " + std::to_string(kPendingKeySize) + " bytes, got " +
                            std::to_string(key.length()));
  }
  checkPrefix(key, DbKeyPrefix::PendingIssuance);
  return PendingIssuanceKey{mint::TransactionId::fromBytes(key.bytes() + 1, mint::TransactionId::SIZE)};
}

Sliver PendingIssuanceKey::prefix() { return Sliver(std::string(1, static_cast<char>(DbKeyPrefix::PendingIssuance))); }

Sliver CoinKey::encode() const {
  std::string out;
  out.reserve(kCoinKeyMinSize + nonce.size());
  out.push_back(static_cast<char>(DbKeyPrefix::Coin));
  out += util::toBigEndianStringBuffer(amount.milli_sat);
  out.append(nonce.begin(), nonce.end());
  return Sliver(std::move(out));
}

CoinKey CoinKey::decode(const Sliver& key) {
  if (key.length() < kCoinKeyMinSize) {
    throw DecodingError(DecodingError::Kind::WrongLength,
                        "coin key must be at least " + std::to_string(kCoinKeyMinSize) + " bytes, got " +
                            std::to_string(key.length()));
  }
  checkPrefix(key, DbKeyPrefix::Coin);
  const auto nonceLen = key.length() - kCoinKeyMinSize;
  if (nonceLen != mint::CoinNonce{}.size()) {
    throw DecodingError(DecodingError::Kind::Malformed, "coin nonce must be 32 bytes, got " + std::to_string(nonceLen));
  }
  CoinKey ret;
  ret.amount = mint::Amount(util::fromBigEndianBuffer<uint64_t>(key.bytes() + 1));
  std::copy(key.bytes() + kCoinKeyMinSize, key.bytes() + key.length(), ret.nonce.begin());
  return ret;
}

Sliver CoinKey::prefix() { return Sliver(std::string(1, static_cast<char>(DbKeyPrefix::Coin))); }

}  // namespace fedmint::client
