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

#include "mint/types.h"

#include <algorithm>
#include <stdexcept>

#include "endianness.hpp"
#include "hex_tools.h"
#include "sha_hash.hpp"

namespace fedmint::mint {

namespace {
const std::string kAmountProofType = "amount";

template <typename Container>
void appendBytes(std::vector<uint8_t>& out, const Container& c) {
  out.insert(out.end(), c.begin(), c.end());
}
}  // namespace

tbs::Message nonceToMessage(const CoinNonce& nonce) { return tbs::hashToMessage(nonce.data(), nonce.size()); }

bool Coin::verify(const tbs::AggregatePublicKey& key) const {
  return tbs::verify(nonceToMessage(nonce), signature, key);
}

bool Coin::verifySpend(const std::string& msg, const std::vector<uint8_t>& sig) const {
  return SpendKey::verify(nonce, reinterpret_cast<const uint8_t*>(msg.data()), msg.size(), sig.data(), sig.size());
}

TransactionId TransactionId::fromBytes(const uint8_t* data, size_t len) {
  if (len != SIZE) {
    throw std::invalid_argument("transaction id must be 32 bytes, got " + std::to_string(len));
  }
  Bytes bytes;
  std::copy(data, data + len, bytes.begin());
  return TransactionId(bytes);
}

TransactionId TransactionId::fromHex(const std::string& hex) {
  const auto bytes = util::unhex(hex);
  return fromBytes(bytes.data(), bytes.size());
}

std::string TransactionId::toHex() const { return util::bufferToHex(bytes_.data(), bytes_.size()); }

std::ostream& operator<<(std::ostream& os, const TransactionId& id) { return os << id.toHex(); }

std::vector<uint8_t> AmountPegInProof::canonicalBytes() const {
  std::vector<uint8_t> out;
  appendBytes(out, kAmountProofType);
  appendBytes(out, util::toBigEndianArrayBuffer(amount_.milli_sat));
  return out;
}

nlohmann::json AmountPegInProof::toJson() const {
  return nlohmann::json{{"type", kAmountProofType}, {"amount", amount_.milli_sat}};
}

std::shared_ptr<const IPegInProof> AmountPegInProof::fromJson(const nlohmann::json& j) {
  if (j.at("type").get<std::string>() != kAmountProofType) {
    throw std::invalid_argument("unknown peg-in proof type " + j.at("type").dump());
  }
  return std::make_shared<AmountPegInProof>(Amount(j.at("amount").get<uint64_t>()));
}

std::vector<uint8_t> PegInRequest::canonicalBytes() const {
  std::vector<uint8_t> out;
  for (const auto& [amount, items] : blind_tokens) {
    appendBytes(out, util::toBigEndianArrayBuffer(amount.milli_sat));
    appendBytes(out, util::toBigEndianArrayBuffer(static_cast<uint32_t>(items.size())));
    for (const auto& msg : items) {
      appendBytes(out, msg.toBytes());
    }
  }
  appendBytes(out, proof->canonicalBytes());
  return out;
}

TransactionId PegInRequest::id() const {
  const auto bytes = canonicalBytes();
  return TransactionId(util::SHA2_256{}.digest(bytes.data(), bytes.size()));
}

}  // namespace fedmint::mint
