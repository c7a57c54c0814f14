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

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mint/amount.h"
#include "mint/coins.h"
#include "mint/spend_key.h"
#include "tbs/BlindSignatures.h"

namespace fedmint::mint {

// The public identity of a coin: the raw Ed25519 public key of its spend key. It is also the message the mint signs.
typedef SpendKey::PublicKeyBytes CoinNonce;

// The message point a nonce is signed as.
tbs::Message nonceToMessage(const CoinNonce& nonce);

// A coin as anyone can see it: the nonce and the federation's unblinded signature on it.
struct Coin {
  CoinNonce nonce;
  tbs::Signature signature;

  bool verify(const tbs::AggregatePublicKey& key) const;
  // Checks a spend signature made with the coin's spend key.
  bool verifySpend(const std::string& msg, const std::vector<uint8_t>& sig) const;

  bool operator==(const Coin& other) const { return nonce == other.nonce && signature == other.signature; }
};

// A SHA-256 over the canonical encoding of a peg-in request. Identifies the issuance at the mints and in the store.
class TransactionId {
 public:
  static constexpr size_t SIZE = 32;
  typedef std::array<uint8_t, SIZE> Bytes;

  TransactionId() : bytes_{} {}
  explicit TransactionId(const Bytes& bytes) : bytes_(bytes) {}

  // Throws std::invalid_argument on bad hex or a length other than 32 bytes.
  static TransactionId fromHex(const std::string& hex);
  static TransactionId fromBytes(const uint8_t* data, size_t len);

  const Bytes& bytes() const { return bytes_; }
  std::string toHex() const;

  bool operator==(const TransactionId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const TransactionId& other) const { return bytes_ != other.bytes_; }
  bool operator<(const TransactionId& other) const { return bytes_ < other.bytes_; }

 private:
  Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const TransactionId& id);

// Evidence that funds were locked on the main chain to back a peg-in.
class IPegInProof {
 public:
  virtual ~IPegInProof() = default;
  virtual Amount amount() const = 0;
  // Bytes that go into the TransactionId.
  virtual std::vector<uint8_t> canonicalBytes() const = 0;
  virtual nlohmann::json toJson() const = 0;
};

// A proof that only states the amount. The mints accept it at face value.
class AmountPegInProof : public IPegInProof {
 public:
  explicit AmountPegInProof(Amount amount) : amount_(amount) {}

  Amount amount() const override { return amount_; }
  std::vector<uint8_t> canonicalBytes() const override;
  nlohmann::json toJson() const override;

  // Throws std::invalid_argument on an unknown proof type.
  static std::shared_ptr<const IPegInProof> fromJson(const nlohmann::json& j);

 private:
  Amount amount_;
};

// Blinded nonces to be signed, grouped by tier.
typedef Coins<tbs::BlindedMessage> SignRequest;

struct PegInRequest {
  SignRequest blind_tokens;
  std::shared_ptr<const IPegInProof> proof;

  // Per tier ascending: 8-byte BE amount, 4-byte BE count, each compressed blinded message. Then the proof bytes.
  std::vector<uint8_t> canonicalBytes() const;
  TransactionId id() const;
};

// A mint's blind signatures, in the shape of the request they answer.
struct SigResponse {
  std::optional<TransactionId> id;
  Coins<tbs::BlindedSignature> signatures;
};

}  // namespace fedmint::mint
