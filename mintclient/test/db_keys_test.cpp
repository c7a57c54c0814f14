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

#include "gtest/gtest.h"

#include <functional>
#include <string>

#include "mintclient/db_keys.h"
#include "mintclient/exception.h"

using namespace fedmint::client;
using fedmint::mint::Amount;
using fedmint::mint::CoinNonce;
using fedmint::mint::TransactionId;
using fedmint::util::Sliver;

namespace {

TransactionId idOf(uint8_t fill) {
  TransactionId::Bytes bytes;
  bytes.fill(fill);
  return TransactionId(bytes);
}

CoinNonce nonceOf(uint8_t fill) {
  CoinNonce nonce;
  nonce.fill(fill);
  return nonce;
}

void expectDecodingError(DecodingError::Kind kind, const std::function<void()>& f) {
  try {
    f();
    FAIL() << "expected DecodingError";
  } catch (const DecodingError& e) {
    ASSERT_EQ(kind, e.kind());
  }
}

TEST(db_keys, pending_issuance_layout) {
  const auto key = PendingIssuanceKey{idOf(0xab)}.encode();
  ASSERT_EQ(33u, key.length());
  ASSERT_EQ(0x21, static_cast<uint8_t>(key[0]));
  ASSERT_EQ(0xab, static_cast<uint8_t>(key[32]));
  ASSERT_EQ(idOf(0xab), PendingIssuanceKey::decode(key).id);
  ASSERT_TRUE(key.startsWith(PendingIssuanceKey::prefix()));
}

TEST(db_keys, pending_issuance_decodes_high_bytes) {
  TransactionId::Bytes bytes;
  for (size_t i = 0; i < bytes.size(); ++i) bytes[i] = static_cast<uint8_t>(0x80 + i * 3);
  const TransactionId id(bytes);
  const auto decoded = PendingIssuanceKey::decode(PendingIssuanceKey{id}.encode());
  ASSERT_EQ(id, decoded.id);
  ASSERT_EQ(0x80, decoded.id.bytes()[0]);
  ASSERT_EQ(0x80 + 31 * 3, decoded.id.bytes()[31]);
}

TEST(db_keys, coin_layout) {
  const auto key = CoinKey{Amount(0x0102), nonceOf(7)}.encode();
  ASSERT_EQ(1u + 8u + 32u, key.length());
  ASSERT_EQ(0x20, static_cast<uint8_t>(key[0]));
  ASSERT_EQ(0x00, static_cast<uint8_t>(key[1]));
  ASSERT_EQ(0x01, static_cast<uint8_t>(key[7]));
  ASSERT_EQ(0x02, static_cast<uint8_t>(key[8]));

  const auto decoded = CoinKey::decode(key);
  ASSERT_EQ(Amount(0x0102), decoded.amount);
  ASSERT_EQ(nonceOf(7), decoded.nonce);
}

TEST(db_keys, pending_issuance_rejects_bad_keys) {
  const auto good = PendingIssuanceKey{idOf(1)}.encode();
  expectDecodingError(DecodingError::Kind::WrongLength, [&]() { PendingIssuanceKey::decode(good.subsliver(0, 32)); });
  expectDecodingError(DecodingError::Kind::WrongLength, [&]() { PendingIssuanceKey::decode(Sliver()); });

  auto bytes = good.toString();
  bytes[0] = 0x20;
  expectDecodingError(DecodingError::Kind::WrongPrefix, [&]() { PendingIssuanceKey::decode(Sliver(std::move(bytes))); });
}

TEST(db_keys, coin_rejects_bad_keys) {
  const auto good = CoinKey{Amount(5), nonceOf(3)}.encode();
  expectDecodingError(DecodingError::Kind::WrongLength, [&]() { CoinKey::decode(good.subsliver(0, 8)); });
  expectDecodingError(DecodingError::Kind::Malformed, [&]() { CoinKey::decode(good.subsliver(0, 20)); });

  auto bytes = good.toString();
  bytes[0] = 0x21;
  expectDecodingError(DecodingError::Kind::WrongPrefix, [&]() { CoinKey::decode(Sliver(std::move(bytes))); });
}

TEST(db_keys, coin_keys_sort_by_amount) {
  const uint64_t amounts[] = {1, 2, 255, 256, 1000, 1ull << 40};
  for (size_t i = 1; i < sizeof(amounts) / sizeof(amounts[0]); ++i) {
    const auto lower = CoinKey{Amount(amounts[i - 1]), nonceOf(0xff)}.encode();
    const auto higher = CoinKey{Amount(amounts[i]), nonceOf(0x00)}.encode();
    ASSERT_LT(lower.toString(), higher.toString()) << amounts[i - 1] << " vs " << amounts[i];
  }
}

TEST(db_keys, record_kinds_do_not_share_a_prefix) {
  ASSERT_FALSE(CoinKey{Amount(1), nonceOf(1)}.encode().startsWith(PendingIssuanceKey::prefix()));
  ASSERT_FALSE(PendingIssuanceKey{idOf(1)}.encode().startsWith(CoinKey::prefix()));
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
