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

#include "mintclient/issuance.h"

#include <algorithm>

#include "Logger.hpp"
#include "hex_tools.h"
#include "kvstream.h"
#include "mintclient/exception.h"

namespace fedmint::client {

using mint::Amount;
using mint::Coins;

mint::Coins<SpendableCoin> IssuanceRequest::finalize(const mint::SigResponse& response,
                                                     const MintKeys& keys,
                                                     const std::optional<mint::TransactionId>& expected_id) const {
  if (!coins_.structuralEq(response.signatures)) {
    LOG_WARN(ISSUANCE_LOG,
             "Response shape mismatch" << KVLOG(coins_.coinCount(), response.signatures.coinCount()));
    throw WrongMintAnswer();
  }
  if (expected_id && response.id && *expected_id != *response.id) {
    throw InvalidIssuanceId(*expected_id, *response.id);
  }

  Coins<SpendableCoin> ret;
  size_t idx = 0;
  for (const auto& z : mint::zipCoins(coins_, response.signatures)) {
    const tbs::AggregatePublicKey* key = nullptr;
    try {
      key = &keys.tier(z.tier);
    } catch (const mint::InvalidAmountTierException& e) {
      throw InvalidAmountTier(e.amount());
    }
    mint::Coin coin{z.left.nonce, tbs::unblindSignature(z.left.blinding_key, z.right)};
    if (!coin.verify(*key)) {
      LOG_WARN(ISSUANCE_LOG, "Signature does not verify" << KVLOG(idx, z.tier));
      throw InvalidSignature(idx);
    }
    ret.push(z.tier, SpendableCoin{std::move(coin), z.left.spend_key});
    ++idx;
  }
  LOG_DEBUG(ISSUANCE_LOG, "Finalized coins" << KVLOG(ret.coinCount(), ret.totalAmount()));
  return ret;
}

namespace {

template <typename Array>
std::string toHex(const Array& a) {
  return util::bufferToHex(a.data(), a.size());
}

std::vector<uint8_t> fromHex(const nlohmann::json& j) { return util::unhex(j.get<std::string>()); }

mint::CoinNonce nonceFromHex(const nlohmann::json& j) {
  const auto bytes = fromHex(j);
  mint::CoinNonce nonce;
  if (bytes.size() != nonce.size()) {
    throw std::invalid_argument("nonce must be 32 bytes, got " + std::to_string(bytes.size()));
  }
  std::copy(bytes.begin(), bytes.end(), nonce.begin());
  return nonce;
}

// Runs a decoder and reports any failure as a malformed record.
template <typename F>
auto decodeRecord(const char* what, F&& f) {
  try {
    return f();
  } catch (const nlohmann::json::exception& e) {
    throw DecodingError(DecodingError::Kind::Malformed, std::string(what) + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw DecodingError(DecodingError::Kind::Malformed, std::string(what) + ": " + e.what());
  }
}

template <typename T, typename Encode>
nlohmann::json tiersToJson(const Coins<T>& coins, Encode&& encode) {
  auto tiers = nlohmann::json::array();
  for (const auto& [amount, items] : coins) {
    auto encoded = nlohmann::json::array();
    for (const auto& item : items) encoded.push_back(encode(item));
    tiers.push_back({{"amount", amount.milli_sat}, {"items", std::move(encoded)}});
  }
  return tiers;
}

}  // namespace

nlohmann::json toJson(const IssuanceRequest& req) {
  return nlohmann::json{{"coins", tiersToJson(req.coins(), [](const CoinRequest& c) {
                           return nlohmann::json{{"spend_key", toHex(c.spend_key.bytes())},
                                                 {"nonce", toHex(c.nonce)},
                                                 {"blinding_key", util::vectorToHex(c.blinding_key.toBytes())}};
                         })}};
}

IssuanceRequest issuanceRequestFromJson(const nlohmann::json& j) {
  return decodeRecord("issuance request", [&]() {
    Coins<CoinRequest> coins;
    for (const auto& tier : j.at("coins")) {
      const auto amount = Amount(tier.at("amount").get<uint64_t>());
      for (const auto& item : tier.at("items")) {
        coins.push(amount,
                   CoinRequest{mint::SpendKey::fromBytes(fromHex(item.at("spend_key"))),
                               nonceFromHex(item.at("nonce")),
                               tbs::BlindingKey::fromBytes(fromHex(item.at("blinding_key")))});
      }
    }
    return IssuanceRequest(std::move(coins));
  });
}

nlohmann::json toJson(const SpendableCoin& coin) {
  return nlohmann::json{{"nonce", toHex(coin.coin.nonce)},
                        {"signature", util::vectorToHex(coin.coin.signature.toBytes())},
                        {"spend_key", toHex(coin.spend_key.bytes())}};
}

SpendableCoin spendableCoinFromJson(const nlohmann::json& j) {
  return decodeRecord("spendable coin", [&]() {
    return SpendableCoin{mint::Coin{nonceFromHex(j.at("nonce")), tbs::Signature::fromBytes(fromHex(j.at("signature")))},
                         mint::SpendKey::fromBytes(fromHex(j.at("spend_key")))};
  });
}

}  // namespace fedmint::client
