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

#include <stdexcept>
#include <string>

#include "mint/amount.h"
#include "mint/types.h"

namespace fedmint::client {

class MintClientException : public std::runtime_error {
 public:
  explicit MintClientException(const std::string& what) : runtime_error(what) {}
};

// A mint was unreachable, returned a non-success status or sent a body that could not be decoded.
class MintError : public MintClientException {
 public:
  explicit MintError(const std::string& what) : MintClientException("mint error: " + what) {}
};

class CoinFinalizationError : public MintClientException {
 public:
  explicit CoinFinalizationError(const std::string& what) : MintClientException("coin finalization failed: " + what) {}
};

// The response does not have the tier/count shape of the request.
class WrongMintAnswer : public CoinFinalizationError {
 public:
  WrongMintAnswer() : CoinFinalizationError("response does not match the request") {}
};

class InvalidSignature : public CoinFinalizationError {
 public:
  explicit InvalidSignature(size_t index)
      : CoinFinalizationError("invalid signature at index " + std::to_string(index)), index_(index) {}

  // Position of the coin in the request, counted over tiers in ascending order.
  size_t index() const { return index_; }

 private:
  size_t index_;
};

class InvalidAmountTier : public CoinFinalizationError {
 public:
  explicit InvalidAmountTier(mint::Amount amount)
      : CoinFinalizationError("no mint key for tier " + std::to_string(amount.milli_sat) + " msat"), amount_(amount) {}

  mint::Amount amount() const { return amount_; }

 private:
  mint::Amount amount_;
};

class InvalidIssuanceId : public CoinFinalizationError {
 public:
  InvalidIssuanceId(const mint::TransactionId& expected, const mint::TransactionId& got)
      : CoinFinalizationError("expected issuance " + expected.toHex() + " but the mint answered " + got.toHex()),
        expected_(expected),
        got_(got) {}

  const mint::TransactionId& expected() const { return expected_; }
  const mint::TransactionId& got() const { return got_; }

 private:
  mint::TransactionId expected_;
  mint::TransactionId got_;
};

class DecodingError : public MintClientException {
 public:
  enum class Kind { WrongLength, WrongPrefix, Malformed };

  DecodingError(Kind kind, const std::string& what) : MintClientException("decoding error: " + what), kind_(kind) {}

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

class InsufficientFunds : public MintClientException {
 public:
  InsufficientFunds(mint::Amount requested, mint::Amount available)
      : MintClientException("insufficient funds: requested " + std::to_string(requested.milli_sat) +
                            " msat, available " + std::to_string(available.milli_sat) + " msat") {}
};

class ConfigurationException : public MintClientException {
 public:
  explicit ConfigurationException(const std::string& what) : MintClientException("configuration error: " + what) {}
};

}  // namespace fedmint::client
