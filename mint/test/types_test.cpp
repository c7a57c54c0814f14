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

#include <random>
#include <string>
#include <vector>

#include "endianness.hpp"
#include "hex_tools.h"
#include "mint/json_codec.h"
#include "mint/types.h"
#include "secure_random.hpp"

using namespace fedmint::mint;
using namespace fedmint;

namespace {

SignRequest sampleRequest(std::mt19937_64& rng) {
  SignRequest req;
  for (uint64_t amount : {1, 1, 4}) {
    auto key = SpendKey::random(rng);
    auto [bkey, blinded] = tbs::blindMessage(nonceToMessage(key.publicKey()), rng);
    req.push(Amount(amount), blinded);
  }
  return req;
}

TEST(spend_key, signature_verifies_against_nonce) {
  util::SecureRandom rng;
  auto key = SpendKey::random(rng);
  Coin coin{key.publicKey(), tbs::Signature{}};
  const auto sig = key.sign("spend 3 coins");
  ASSERT_EQ(SpendKey::SignatureByteSize, sig.size());
  ASSERT_TRUE(coin.verifySpend("spend 3 coins", sig));
  ASSERT_FALSE(coin.verifySpend("spend 4 coins", sig));

  auto other = SpendKey::random(rng);
  Coin otherCoin{other.publicKey(), tbs::Signature{}};
  ASSERT_FALSE(otherCoin.verifySpend("spend 3 coins", sig));
}

TEST(spend_key, bytes_round_trip) {
  std::mt19937_64 rng(1);
  auto key = SpendKey::random(rng);
  const std::vector<uint8_t> bytes(key.bytes().begin(), key.bytes().end());
  ASSERT_EQ(key, SpendKey::fromBytes(bytes));
  ASSERT_THROW(SpendKey::fromBytes(std::vector<uint8_t>(31)), std::invalid_argument);
}

TEST(peg_in_request, canonical_encoding_layout) {
  std::mt19937_64 rng(2);
  PegInRequest req{sampleRequest(rng), std::make_shared<AmountPegInProof>(Amount(6))};
  const auto bytes = req.canonicalBytes();
  const size_t g1 = static_cast<size_t>(tbs::Library::Get().getG1PointSize());

  ASSERT_EQ(2 * 12 + 3 * g1 + 6 + 8, bytes.size());
  ASSERT_EQ(1u, util::fromBigEndianBuffer<uint64_t>(bytes.data()));
  ASSERT_EQ(2u, util::fromBigEndianBuffer<uint32_t>(bytes.data() + 8));
  ASSERT_EQ(4u, util::fromBigEndianBuffer<uint64_t>(bytes.data() + 12 + 2 * g1));
  ASSERT_EQ("amount", std::string(bytes.end() - 14, bytes.end() - 8));
  ASSERT_EQ(6u, util::fromBigEndianBuffer<uint64_t>(&*(bytes.end() - 8)));
}

TEST(peg_in_request, id_is_deterministic_and_content_bound) {
  std::mt19937_64 rng(3);
  auto tokens = sampleRequest(rng);
  PegInRequest a{tokens, std::make_shared<AmountPegInProof>(Amount(6))};
  PegInRequest b{tokens, std::make_shared<AmountPegInProof>(Amount(6))};
  PegInRequest c{tokens, std::make_shared<AmountPegInProof>(Amount(7))};
  ASSERT_EQ(a.id(), b.id());
  ASSERT_NE(a.id(), c.id());
  ASSERT_EQ(64u, a.id().toHex().size());
  ASSERT_EQ(a.id(), TransactionId::fromHex(a.id().toHex()));
}

TEST(json_codec, peg_in_request_shape) {
  std::mt19937_64 rng(4);
  PegInRequest req{sampleRequest(rng), std::make_shared<AmountPegInProof>(Amount(6))};
  const auto j = toJson(req);
  ASSERT_EQ("amount", j.at("proof").at("type"));
  ASSERT_EQ(6u, j.at("proof").at("amount").get<uint64_t>());
  ASSERT_EQ(2u, j.at("blind_tokens").at("coins").size());
  ASSERT_EQ(1u, j.at("blind_tokens").at("coins")[0].at("amount").get<uint64_t>());
  ASSERT_EQ(2u, j.at("blind_tokens").at("coins")[0].at("items").size());

  const auto decoded = pegInRequestFromJson(nlohmann::json::parse(j.dump()));
  ASSERT_EQ(req.id(), decoded.id());
}

TEST(json_codec, sig_response_id_is_optional) {
  auto j = nlohmann::json::parse(R"({"signatures": {"coins": []}})");
  ASSERT_FALSE(sigResponseFromJson(j).id.has_value());

  j["id"] = std::string(64, 'a');
  ASSERT_TRUE(sigResponseFromJson(j).id.has_value());

  j["id"] = "abc";
  ASSERT_THROW(sigResponseFromJson(j), std::invalid_argument);
  ASSERT_THROW(sigResponseFromJson(nlohmann::json::parse("{}")), nlohmann::json::exception);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
