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

#include "fake_mint.h"
#include "mintclient/coin_store.h"
#include "mintclient/db_keys.h"
#include "mintclient/exception.h"
#include "storage/test/storage_test_common.h"

using namespace fedmint::client;
using fedmint::client::test::Federation;
using fedmint::mint::Amount;
using fedmint::mint::SigResponse;
using fedmint::mint::TransactionId;
namespace tbs = fedmint::tbs;

namespace {

class coin_store : public ::testing::Test {
 protected:
  struct Issued {
    TransactionId id;
    IssuanceRequest request;
    fedmint::mint::Coins<SpendableCoin> coins;
  };

  Issued issue(Amount amount) {
    auto [request, sign_request] = IssuanceRequest::create(amount, federation.keys, rng);
    SigResponse response;
    for (const auto& [tier, blinded] : sign_request) {
      for (const auto& b : blinded) {
        response.signatures.push(tier, tbs::signBlindedMessage(b, federation.secret.at(tier)));
      }
    }
    const auto id = fedmint::mint::PegInRequest{sign_request, std::make_shared<fedmint::mint::AmountPegInProof>(amount)}.id();
    auto coins = request.finalize(response, federation.keys);
    return Issued{id, std::move(request), std::move(coins)};
  }

  Federation federation = Federation::create({1, 2, 4, 8});
  std::mt19937_64 rng{5};
  std::shared_ptr<FailingCommitDb> db = std::make_shared<FailingCommitDb>(TestMemoryDb::create());
  CoinStore store{db};
};

TEST_F(coin_store, pending_issuance_round_trip) {
  auto a = issue(Amount(3));
  auto b = issue(Amount(9));
  store.recordPending(a.id, a.request);
  store.recordPending(b.id, b.request);

  const auto pending = store.listPending().toVector();
  ASSERT_EQ(2u, pending.size());
  for (const auto& p : pending) {
    ASSERT_TRUE(p.id == a.id || p.id == b.id);
    ASSERT_EQ(p.id == a.id ? Amount(3) : Amount(9), p.request.amount());
  }
  ASSERT_TRUE(store.getPending(a.id).has_value());
  ASSERT_TRUE(store.listOwnedCoins().toVector().empty());
}

TEST_F(coin_store, pending_issuance_is_written_by_a_commit) {
  auto a = issue(Amount(6));
  store.recordPending(a.id, a.request);
  ASSERT_EQ(1u, db->commits());
  ASSERT_TRUE(store.getPending(a.id).has_value());

  auto b = issue(Amount(5));
  db->failCommits(true);
  ASSERT_THROW(store.recordPending(b.id, b.request), fedmint::storage::StorageException);
  ASSERT_FALSE(store.getPending(b.id).has_value());
  ASSERT_EQ(1u, store.listPending().toVector().size());
}

TEST_F(coin_store, redeem_moves_pending_to_coins) {
  auto a = issue(Amount(7));
  auto b = issue(Amount(8));
  store.recordPending(a.id, a.request);
  store.recordPending(b.id, b.request);

  RedeemBatch batch;
  batch.coins.append(a.coins);
  batch.issuances.push_back(a.id);
  store.commitRedeemed(batch);

  const auto pending = store.listPending().toVector();
  ASSERT_EQ(1u, pending.size());
  ASSERT_EQ(b.id, pending[0].id);
  ASSERT_FALSE(store.getPending(a.id).has_value());

  const auto owned = store.listOwnedCoins().toVector();
  ASSERT_EQ(3u, owned.size());
  // Ascending tier order.
  ASSERT_EQ(Amount(1), owned[0].amount);
  ASSERT_EQ(Amount(2), owned[1].amount);
  ASSERT_EQ(Amount(4), owned[2].amount);
  for (const auto& c : owned) {
    ASSERT_TRUE(c.coin.coin.verify(federation.keys.tier(c.amount)));
  }
}

TEST_F(coin_store, failed_commit_changes_nothing) {
  auto a = issue(Amount(5));
  store.recordPending(a.id, a.request);

  db->failCommits(true);
  RedeemBatch batch;
  batch.coins.append(a.coins);
  batch.issuances.push_back(a.id);
  ASSERT_THROW(store.commitRedeemed(batch), fedmint::storage::StorageException);

  ASSERT_EQ(1u, store.listPending().toVector().size());
  ASSERT_TRUE(store.listOwnedCoins().toVector().empty());
}

TEST_F(coin_store, ranges_rescan_on_begin) {
  const auto range = store.listOwnedCoins();
  ASSERT_TRUE(range.begin() == range.end());

  auto a = issue(Amount(2));
  store.commitRedeemed(RedeemBatch{a.coins, {}});
  size_t n = 0;
  for (const auto& c : range) {
    ASSERT_EQ(Amount(2), c.amount);
    ++n;
  }
  ASSERT_EQ(1u, n);
}

TEST_F(coin_store, spend_deletes_exactly_the_given_coins) {
  auto a = issue(Amount(15));
  store.commitRedeemed(RedeemBatch{a.coins, {}});

  fedmint::mint::Coins<SpendableCoin> spent;
  spent.push(Amount(8), a.coins.byTier().at(Amount(8)).front());
  spent.push(Amount(1), a.coins.byTier().at(Amount(1)).front());
  store.spend(spent);

  const auto owned = store.listOwnedCoins().toVector();
  ASSERT_EQ(2u, owned.size());
  ASSERT_EQ(Amount(2), owned[0].amount);
  ASSERT_EQ(Amount(4), owned[1].amount);

  db->failCommits(true);
  ASSERT_THROW(store.spend(a.coins), fedmint::storage::StorageException);
  ASSERT_EQ(2u, store.listOwnedCoins().toVector().size());
}

TEST_F(coin_store, undecodable_records_throw) {
  auto a = issue(Amount(1));
  store.recordPending(a.id, a.request);
  ASSERT_TRUE(db->put(PendingIssuanceKey::prefix(), fedmint::util::Sliver(std::string("{}"))).isOK());
  try {
    store.listPending().toVector();
    FAIL() << "expected DecodingError";
  } catch (const DecodingError& e) {
    ASSERT_EQ(DecodingError::Kind::WrongLength, e.kind());
  }

  ASSERT_TRUE(db->del(PendingIssuanceKey::prefix()).isOK());
  ASSERT_TRUE(db->put(PendingIssuanceKey{a.id}.encode(), fedmint::util::Sliver(std::string("not json"))).isOK());
  ASSERT_THROW(store.getPending(a.id), DecodingError);
}

}  // namespace
