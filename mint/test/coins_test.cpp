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

#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "mint/coins.h"

using namespace fedmint::mint;

namespace {

Keys<int> tiers(std::initializer_list<uint64_t> amounts) {
  Keys<int> keys;
  for (auto a : amounts) keys.insert(Amount(a), 0);
  return keys;
}

TEST(amount, arithmetic_and_printing) {
  ASSERT_EQ(Amount(7), Amount(3) + Amount(4));
  ASSERT_EQ(Amount(3), Amount(7) - Amount(4));
  ASSERT_THROW(Amount(3) - Amount(4), std::underflow_error);
  ASSERT_EQ(Amount(12), Amount(4) * 3);
  ASSERT_EQ(2u, Amount(9) / Amount(4));
  ASSERT_EQ(Amount(1), Amount(9) % Amount(4));

  std::ostringstream os;
  os << Amount(42);
  ASSERT_EQ("42 msat", os.str());
}

TEST(amount, overflow_throws) {
  const Amount max(std::numeric_limits<uint64_t>::max());
  ASSERT_EQ(max, Amount(max.milli_sat - 1) + Amount(1));
  ASSERT_THROW(max + Amount(1), std::overflow_error);
  Amount sum(max.milli_sat - 2);
  ASSERT_THROW(sum += Amount(3), std::overflow_error);
  ASSERT_EQ(Amount(max.milli_sat - 2), sum);
  ASSERT_EQ(Amount(0), max * 0);
  ASSERT_THROW(Amount(1ull << 63) * 2, std::overflow_error);
}

TEST(coins, total_amount_overflow_throws) {
  Coins<int> coins;
  coins.push(Amount(1ull << 63), 1);
  coins.push(Amount(1ull << 63), 2);
  ASSERT_THROW(coins.totalAmount(), std::overflow_error);
}

TEST(keys, missing_tier_throws_with_amount) {
  auto keys = tiers({1, 10});
  ASSERT_EQ(0, keys.tier(Amount(10)));
  try {
    keys.tier(Amount(5));
    FAIL() << "expected InvalidAmountTierException";
  } catch (const InvalidAmountTierException& e) {
    ASSERT_EQ(Amount(5), e.amount());
  }
  ASSERT_FALSE(keys.insert(Amount(1), 1));
  ASSERT_EQ((std::vector<Amount>{Amount(1), Amount(10)}), keys.tiers());
}

TEST(represent_amount, greedy_from_largest_tier) {
  auto keys = tiers({1, 2, 5, 10});
  auto counts = representAmount(Amount(27), keys);
  ASSERT_EQ((TierCounts{{Amount(10), 2}, {Amount(5), 1}, {Amount(2), 1}}), counts);
}

TEST(represent_amount, zero_amount_is_empty) { ASSERT_TRUE(representAmount(Amount(0), tiers({1})).empty()); }

TEST(represent_amount, remainder_throws) {
  auto keys = tiers({4, 10});
  try {
    representAmount(Amount(27), keys);
    FAIL() << "expected InvalidAmountTierException";
  } catch (const InvalidAmountTierException& e) {
    ASSERT_EQ(Amount(3), e.amount());
  }
  ASSERT_THROW(representAmount(Amount(5), Keys<int>{}), InvalidAmountTierException);
}

TEST(coins, counts_and_totals) {
  Coins<std::string> coins;
  coins.push(Amount(10), "a");
  coins.push(Amount(1), "b");
  coins.push(Amount(10), "c");
  ASSERT_EQ(3u, coins.coinCount());
  ASSERT_EQ(Amount(21), coins.totalAmount());

  const auto flat = coins.flatten();
  ASSERT_EQ(3u, flat.size());
  ASSERT_EQ(Amount(1), flat[0].first);
  ASSERT_EQ("a", flat[1].second);
  ASSERT_EQ("c", flat[2].second);
}

TEST(coins, structural_equality) {
  Coins<std::string> a;
  a.push(Amount(1), "x");
  a.push(Amount(1), "y");
  a.push(Amount(2), "z");

  Coins<int> same;
  same.push(Amount(2), 3);
  same.push(Amount(1), 1);
  same.push(Amount(1), 2);
  ASSERT_TRUE(a.structuralEq(same));

  Coins<int> fewer;
  fewer.push(Amount(1), 1);
  fewer.push(Amount(2), 3);
  ASSERT_FALSE(a.structuralEq(fewer));

  Coins<int> otherTier;
  otherTier.push(Amount(1), 1);
  otherTier.push(Amount(1), 2);
  otherTier.push(Amount(4), 3);
  ASSERT_FALSE(a.structuralEq(otherTier));

  Coins<int> extraTier = same;
  extraTier.push(Amount(8), 0);
  ASSERT_FALSE(a.structuralEq(extraTier));
  ASSERT_FALSE(a.structuralEq(Coins<int>{}));
}

TEST(coins, empty_tiers_are_dropped) {
  Coins<int> coins(Coins<int>::TierMap{{Amount(1), {}}, {Amount(2), {7}}});
  ASSERT_EQ(1u, coins.byTier().size());
  Coins<int> other;
  other.push(Amount(2), 1);
  ASSERT_TRUE(coins.structuralEq(other));
}

TEST(zip_coins, pairs_positionally) {
  Coins<std::string> left;
  left.push(Amount(2), "b0");
  left.push(Amount(1), "a0");
  left.push(Amount(2), "b1");
  Coins<int> right;
  right.push(Amount(1), 10);
  right.push(Amount(2), 20);
  right.push(Amount(2), 21);

  const auto zipped = zipCoins(left, right);
  ASSERT_EQ(3u, zipped.size());
  ASSERT_EQ(Amount(1), zipped[0].tier);
  ASSERT_EQ("a0", zipped[0].left);
  ASSERT_EQ(10, zipped[0].right);
  ASSERT_EQ("b1", zipped[2].left);
  ASSERT_EQ(21, zipped[2].right);

  right.push(Amount(2), 22);
  ASSERT_THROW(zipCoins(left, right), std::invalid_argument);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
