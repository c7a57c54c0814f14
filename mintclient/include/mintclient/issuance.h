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

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "mint/coins.h"
#include "mint/spend_key.h"
#include "mint/types.h"
#include "secure_random.hpp"
#include "tbs/BlindSignatures.h"

namespace fedmint::client {

using MintKeys = mint::Keys<tbs::AggregatePublicKey>;

// The private material behind one requested coin. It never leaves the client.
struct CoinRequest {
  mint::SpendKey spend_key;
  mint::CoinNonce nonce;
  tbs::BlindingKey blinding_key;

  template <typename Rng>
  static std::pair<CoinRequest, tbs::BlindedMessage> create(Rng& rng) {
    static_assert(util::is_crypto_rng_v<Rng>, "coin secrets need a cryptographically secure generator");
    auto spend_key = mint::SpendKey::random(rng);
    auto nonce = spend_key.publicKey();
    auto [blinding_key, blinded] = tbs::blindMessage(mint::nonceToMessage(nonce), rng);
    return {CoinRequest{std::move(spend_key), nonce, std::move(blinding_key)}, std::move(blinded)};
  }
};

// A coin together with the key that can spend it.
struct SpendableCoin {
  mint::Coin coin;
  mint::SpendKey spend_key;

  // Signs `msg` with the spend key. Coin::verifySpend checks the result against the nonce.
  std::vector<uint8_t> sign(const std::string& msg) const { return spend_key.sign(msg); }

  bool operator==(const SpendableCoin& other) const { return coin == other.coin && spend_key == other.spend_key; }
};

class IssuanceRequest {
 public:
  explicit IssuanceRequest(mint::Coins<CoinRequest> coins) : coins_(std::move(coins)) {}

  // Splits `amount` into the tiers of `keys` and prepares one blinded coin per draw. The returned SignRequest lines
  // up positionally with the coins of the IssuanceRequest. Throws mint::InvalidAmountTierException if the amount
  // cannot be represented.
  template <typename K, typename Rng>
  static std::pair<IssuanceRequest, mint::SignRequest> create(mint::Amount amount, const mint::Keys<K>& keys,
                                                              Rng& rng) {
    static_assert(util::is_crypto_rng_v<Rng>, "coin secrets need a cryptographically secure generator");
    mint::Coins<CoinRequest> coins;
    mint::SignRequest sign_request;
    for (const auto& [tier, count] : mint::representAmount(amount, keys)) {
      for (size_t i = 0; i < count; ++i) {
        auto [request, blinded] = CoinRequest::create(rng);
        coins.push(tier, std::move(request));
        sign_request.push(tier, std::move(blinded));
      }
    }
    return {IssuanceRequest(std::move(coins)), std::move(sign_request)};
  }

  // Turns a mint's blind signatures into verified coins. Either every coin verifies or an exception derived from
  // CoinFinalizationError is thrown. When `expected_id` is set, a response that names another issuance is rejected.
  mint::Coins<SpendableCoin> finalize(const mint::SigResponse& response,
                                      const MintKeys& keys,
                                      const std::optional<mint::TransactionId>& expected_id = std::nullopt) const;

  const mint::Coins<CoinRequest>& coins() const { return coins_; }
  mint::Amount amount() const { return coins_.totalAmount(); }

 private:
  mint::Coins<CoinRequest> coins_;
};

// Storage encodings. Decoding throws DecodingError with kind Malformed.
nlohmann::json toJson(const IssuanceRequest& req);
IssuanceRequest issuanceRequestFromJson(const nlohmann::json& j);

nlohmann::json toJson(const SpendableCoin& coin);
SpendableCoin spendableCoinFromJson(const nlohmann::json& j);

}  // namespace fedmint::client
