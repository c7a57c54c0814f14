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

// Binary keys of the two record kinds in the client database.
//
//   pending issuance: 0x21 || 32-byte TransactionId
//   owned coin:       0x20 || 8-byte big-endian amount || nonce
//
// The big-endian amount makes a scan over the coin prefix return coins in ascending tier order.

#pragma once

#include <cstdint>

#include "mint/types.h"
#include "sliver.hpp"

namespace fedmint::client {

enum class DbKeyPrefix : uint8_t {
  Coin = 0x20,
  PendingIssuance = 0x21,
};

struct PendingIssuanceKey {
  mint::TransactionId id;

  util::Sliver encode() const;
  // Throws DecodingError.
  static PendingIssuanceKey decode(const util::Sliver& key);
  // The key of every pending issuance starts with this.
  static util::Sliver prefix();

  bool operator==(const PendingIssuanceKey& other) const { return id == other.id; }
};

struct CoinKey {
  mint::Amount amount;
  mint::CoinNonce nonce;

  util::Sliver encode() const;
  // Throws DecodingError.
  static CoinKey decode(const util::Sliver& key);
  static util::Sliver prefix();

  bool operator==(const CoinKey& other) const { return amount == other.amount && nonce == other.nonce; }
};

}  // namespace fedmint::client
