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

#include <algorithm>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <vector>

#include "mint/types.h"
#include "mintclient/coin_store.h"
#include "mintclient/issuance.h"
#include "mintclient/mint_connection.h"
#include "mintclient/quorums.h"
#include "storage/db_interface.h"

namespace fedmint::client {

// The client side of a federated mint.
//
// Peg-ins are written to the store as pending before any mint is contacted and are broadcast to the mints in random
// order until a Byzantine-safe quorum accepted them. fetchAll() later collects the signatures for every pending
// issuance from one randomly chosen mint and turns them into owned coins in a single atomic commit.
class MintClient {
 public:
  // Throws ConfigurationException if `mints` is empty.
  MintClient(std::vector<std::shared_ptr<IMintConnection>> mints,
             MintKeys keys,
             std::shared_ptr<storage::IDBClient> db,
             std::optional<uint16_t> f_val = std::nullopt);

  // Prepares coins worth the proof's amount, records them as pending and broadcasts the peg-in. Returns the issuance
  // id once at least one mint accepted. Throws MintError if none did; the pending record stays in that case.
  template <typename Rng>
  mint::TransactionId pegIn(std::shared_ptr<const mint::IPegInProof> proof, Rng& rng) {
    static_assert(util::is_crypto_rng_v<Rng>, "peg-in needs a cryptographically secure generator");
    auto [issuance, sign_request] = IssuanceRequest::create(proof->amount(), keys_, rng);
    std::vector<size_t> order(mints_.size());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);
    return broadcast(issuance, mint::PegInRequest{std::move(sign_request), std::move(proof)}, order);
  }

  // Redeems every pending issuance. Either all of them become coins or the store is left untouched. Throws MintError
  // if any fetch failed and CoinFinalizationError if any answer does not finalize.
  template <typename Rng>
  std::vector<mint::TransactionId> fetchAll(Rng& rng) {
    std::uniform_int_distribution<size_t> pick(0, mints_.size() - 1);
    return fetchAllFrom(*mints_[pick(rng)]);
  }

  mint::Coins<SpendableCoin> coins() const;
  mint::Amount balance() const;

  // Picks owned coins adding up to exactly `amount`, largest tiers first. Throws InsufficientFunds if the balance is
  // too low and mint::InvalidAmountTierException with the remainder if the owned coins cannot make the amount.
  mint::Coins<SpendableCoin> selectCoins(mint::Amount amount) const;
  void spendCoins(const mint::Coins<SpendableCoin>& coins);

  std::vector<mint::TransactionId> pendingIssuances() const;

  const QuorumConverter& quorums() const { return quorums_; }
  const MintKeys& keys() const { return keys_; }

 private:
  mint::TransactionId broadcast(const IssuanceRequest& issuance,
                                const mint::PegInRequest& request,
                                const std::vector<size_t>& order);
  std::vector<mint::TransactionId> fetchAllFrom(IMintConnection& conn);

  std::vector<std::shared_ptr<IMintConnection>> mints_;
  MintKeys keys_;
  CoinStore store_;
  QuorumConverter quorums_;
};

}  // namespace fedmint::client
