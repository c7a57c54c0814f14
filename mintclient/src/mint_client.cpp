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

#include "mintclient/mint_client.h"

#include <algorithm>
#include <future>
#include <memory>
#include <system_error>

#include "Logger.hpp"
#include "kvstream.h"
#include "mint/json_codec.h"
#include "mintclient/exception.h"
#include "thread_pool.hpp"

namespace fedmint::client {

using mint::Amount;
using mint::TransactionId;

namespace {
// Fetches beyond this many wait in the pool's queue.
constexpr size_t kMaxFetchThreads = 8;
}  // namespace

MintClient::MintClient(std::vector<std::shared_ptr<IMintConnection>> mints,
                       MintKeys keys,
                       std::shared_ptr<storage::IDBClient> db,
                       std::optional<uint16_t> f_val)
    : mints_(std::move(mints)), keys_(std::move(keys)), store_(std::move(db)), quorums_(mints_.size(), f_val) {
  if (keys_.empty()) {
    throw ConfigurationException("no mint keys configured");
  }
}

TransactionId MintClient::broadcast(const IssuanceRequest& issuance,
                                    const mint::PegInRequest& request,
                                    const std::vector<size_t>& order) {
  const auto id = request.id();
  SCOPED_MDC_TX_ID(id.toHex());
  store_.recordPending(id, issuance);

  const auto quorum = quorums_.byzantineSafeQuorum();
  size_t accepted = 0;
  for (auto i : order) {
    auto& conn = *mints_[i];
    SCOPED_MDC_MINT(conn.url());
    try {
      conn.pegIn(request);
      ++accepted;
    } catch (const std::exception& e) {
      LOG_WARN(GATEWAY_LOG, "Mint did not accept peg-in" << KVLOG(conn.url(), e.what()));
      continue;
    }
    if (accepted >= quorum) break;
  }

  if (accepted == 0) {
    throw MintError("no mint accepted peg-in " + id.toHex());
  }
  LOG_INFO(GATEWAY_LOG, "Peg-in broadcast" << KVLOG(accepted, quorum, issuance.amount()));
  return id;
}

std::vector<TransactionId> MintClient::fetchAllFrom(IMintConnection& conn) {
  const auto pending = store_.listPending().toVector();
  if (pending.empty()) {
    LOG_DEBUG(GATEWAY_LOG, "No pending issuances");
    return {};
  }
  LOG_INFO(GATEWAY_LOG, "Fetching signatures" << KVLOG(conn.url(), pending.size()));

  std::vector<nlohmann::json> answers;
  answers.reserve(pending.size());
  {
    std::unique_ptr<util::ThreadPool> pool;
    try {
      pool = std::make_unique<util::ThreadPool>(
          static_cast<unsigned int>(std::min(pending.size(), kMaxFetchThreads)));
    } catch (const std::system_error& e) {
      throw MintError(std::string("cannot start fetch workers: ") + e.what());
    }
    std::vector<std::future<nlohmann::json>> futures;
    futures.reserve(pending.size());
    for (const auto& p : pending) {
      futures.push_back(pool->async([&conn](const TransactionId& id) {
        SCOPED_MDC_TX_ID(id.toHex());
        SCOPED_MDC_MINT(conn.url());
        return conn.fetchIssuance(id);
      }, p.id));
    }

    // Every fetch is waited for before the first failure is reported.
    std::optional<std::string> failure;
    for (size_t i = 0; i < futures.size(); ++i) {
      try {
        answers.push_back(futures[i].get());
      } catch (const std::exception& e) {
        LOG_WARN(GATEWAY_LOG, "Fetch failed" << KVLOG(pending[i].id, e.what()));
        if (!failure) failure = e.what();
      }
    }
    if (failure) {
      throw MintError("fetching from " + conn.url() + " failed: " + *failure);
    }
  }

  SCOPED_MDC_MINT(conn.url());
  RedeemBatch batch;
  for (size_t i = 0; i < pending.size(); ++i) {
    const auto& id = pending[i].id;
    SCOPED_MDC_TX_ID(id.toHex());
    mint::SigResponse response;
    try {
      response = mint::sigResponseFromJson(answers[i]);
    } catch (const nlohmann::json::exception& e) {
      throw MintError(conn.url() + " sent an undecodable answer for " + id.toHex() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
      throw MintError(conn.url() + " sent an undecodable answer for " + id.toHex() + ": " + e.what());
    }
    batch.coins.append(pending[i].request.finalize(response, keys_, id));
    batch.issuances.push_back(id);
  }

  store_.commitRedeemed(batch);
  LOG_INFO(GATEWAY_LOG, "Redeemed issuances" << KVLOG(batch.issuances.size(), batch.coins.totalAmount()));
  return batch.issuances;
}

mint::Coins<SpendableCoin> MintClient::coins() const {
  mint::Coins<SpendableCoin> ret;
  for (auto&& owned : store_.listOwnedCoins()) {
    ret.push(owned.amount, std::move(owned.coin));
  }
  return ret;
}

Amount MintClient::balance() const {
  Amount total;
  for (auto&& owned : store_.listOwnedCoins()) total += owned.amount;
  return total;
}

mint::Coins<SpendableCoin> MintClient::selectCoins(Amount amount) const {
  const auto owned = store_.listOwnedCoins().toVector();
  Amount available;
  for (const auto& c : owned) available += c.amount;
  if (available < amount) {
    throw InsufficientFunds(amount, available);
  }

  mint::Coins<SpendableCoin> selected;
  Amount remaining = amount;
  for (auto it = owned.rbegin(); it != owned.rend() && !remaining.isZero(); ++it) {
    if (it->amount <= remaining) {
      selected.push(it->amount, it->coin);
      remaining = remaining - it->amount;
    }
  }
  if (!remaining.isZero()) {
    throw mint::InvalidAmountTierException(remaining);
  }
  return selected;
}

void MintClient::spendCoins(const mint::Coins<SpendableCoin>& coins) { store_.spend(coins); }

std::vector<TransactionId> MintClient::pendingIssuances() const {
  std::vector<TransactionId> ids;
  for (auto&& p : store_.listPending()) ids.push_back(p.id);
  return ids;
}

}  // namespace fedmint::client
