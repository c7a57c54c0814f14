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

#include "mint/json_codec.h"

namespace fedmint::mint {

nlohmann::json toJson(const PegInRequest& req) {
  return nlohmann::json{{"blind_tokens", coinsToJson(req.blind_tokens)}, {"proof", req.proof->toJson()}};
}

PegInRequest pegInRequestFromJson(const nlohmann::json& j) {
  PegInRequest req;
  req.blind_tokens = coinsFromJson<tbs::BlindedMessage>(j.at("blind_tokens"));
  req.proof = AmountPegInProof::fromJson(j.at("proof"));
  return req;
}

nlohmann::json toJson(const SigResponse& resp) {
  auto j = nlohmann::json{{"signatures", coinsToJson(resp.signatures)}};
  if (resp.id) {
    j["id"] = resp.id->toHex();
  }
  return j;
}

SigResponse sigResponseFromJson(const nlohmann::json& j) {
  SigResponse resp;
  if (j.contains("id") && !j.at("id").is_null()) {
    resp.id = TransactionId::fromHex(j.at("id").get<std::string>());
  }
  resp.signatures = coinsFromJson<tbs::BlindedSignature>(j.at("signatures"));
  return resp;
}

}  // namespace fedmint::mint
