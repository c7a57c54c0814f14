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

// JSON encodings used on the mint API.
//
//   Coins:        {"coins": [{"amount": <u64>, "items": [<hex>, ...]}, ...]}, tiers ascending
//   PegInRequest: {"blind_tokens": <Coins>, "proof": {"type": "amount", "amount": <u64>}}
//   SigResponse:  {"id": <hex> (optional), "signatures": <Coins>}
//
// Decoding throws nlohmann::json::exception on a wrong shape and std::invalid_argument on bad hex or a bad point.

#pragma once

#include <nlohmann/json.hpp>

#include "hex_tools.h"
#include "mint/types.h"

namespace fedmint::mint {

template <typename T>
nlohmann::json coinsToJson(const Coins<T>& coins) {
  auto tiers = nlohmann::json::array();
  for (const auto& [amount, items] : coins) {
    auto hexItems = nlohmann::json::array();
    for (const auto& item : items) {
      hexItems.push_back(util::vectorToHex(item.toBytes()));
    }
    tiers.push_back({{"amount", amount.milli_sat}, {"items", std::move(hexItems)}});
  }
  return nlohmann::json{{"coins", std::move(tiers)}};
}

template <typename T>
Coins<T> coinsFromJson(const nlohmann::json& j) {
  Coins<T> coins;
  for (const auto& tier : j.at("coins")) {
    const auto amount = Amount(tier.at("amount").get<uint64_t>());
    for (const auto& item : tier.at("items")) {
      coins.push(amount, T::fromBytes(util::unhex(item.get<std::string>())));
    }
  }
  return coins;
}

nlohmann::json toJson(const PegInRequest& req);
PegInRequest pegInRequestFromJson(const nlohmann::json& j);

nlohmann::json toJson(const SigResponse& resp);
SigResponse sigResponseFromJson(const nlohmann::json& j);

}  // namespace fedmint::mint
