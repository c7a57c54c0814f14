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

#include <cstddef>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

#include "mint/amount.h"
#include "mint/exception.h"

namespace fedmint::mint {

// Key material per denomination tier, e.g. the federation's aggregate public key for each tier.
template <typename K>
class Keys {
 public:
  Keys() = default;
  explicit Keys(std::map<Amount, K> keys) : keys_(std::move(keys)) {}

  // Throws InvalidAmountTierException if the tier is unknown.
  const K& tier(Amount amount) const {
    auto it = keys_.find(amount);
    if (it == keys_.end()) {
      throw InvalidAmountTierException(amount);
    }
    return it->second;
  }

  bool contains(Amount amount) const { return keys_.count(amount) > 0; }

  // Returns false if the tier already has a key.
  bool insert(Amount amount, K key) { return keys_.emplace(amount, std::move(key)).second; }

  // Ascending.
  std::vector<Amount> tiers() const {
    std::vector<Amount> ret;
    ret.reserve(keys_.size());
    for (const auto& kv : keys_) ret.push_back(kv.first);
    return ret;
  }

  size_t size() const { return keys_.size(); }
  bool empty() const { return keys_.empty(); }

  auto begin() const { return keys_.begin(); }
  auto end() const { return keys_.end(); }

 private:
  std::map<Amount, K> keys_;
};

// How many coins of each tier make up an amount.
typedef std::map<Amount, size_t> TierCounts;

// Greedy change-making from the largest tier down. Tiers that are not drawn are left out. Throws
// InvalidAmountTierException carrying the remainder if the amount cannot be made exactly.
template <typename K>
TierCounts representAmount(Amount amount, const Keys<K>& keys) {
  TierCounts counts;
  auto remaining = amount;
  const auto tiers = keys.tiers();
  for (auto it = tiers.rbegin(); it != tiers.rend(); ++it) {
    if (it->isZero()) continue;
    const auto n = remaining / *it;
    if (n > 0) {
      counts[*it] = n;
      remaining = remaining % *it;
    }
  }
  if (!remaining.isZero()) {
    throw InvalidAmountTierException(remaining);
  }
  return counts;
}

// Items grouped by denomination tier. Within a tier the insertion order is kept, so two containers built from the
// same request line up position by position.
template <typename T>
class Coins {
 public:
  typedef std::map<Amount, std::vector<T>> TierMap;

  Coins() = default;
  explicit Coins(TierMap coins) : coins_(std::move(coins)) {
    for (auto it = coins_.begin(); it != coins_.end();) {
      it = it->second.empty() ? coins_.erase(it) : std::next(it);
    }
  }

  void push(Amount amount, T item) { coins_[amount].push_back(std::move(item)); }

  void append(const Coins<T>& other) {
    for (const auto& [amount, items] : other.coins_) {
      auto& tier = coins_[amount];
      tier.insert(tier.end(), items.begin(), items.end());
    }
  }

  // Same tiers with the same number of items in each.
  template <typename U>
  bool structuralEq(const Coins<U>& other) const {
    if (coins_.size() != other.byTier().size()) return false;
    auto it = other.byTier().begin();
    for (const auto& [amount, items] : coins_) {
      if (amount != it->first || items.size() != it->second.size()) return false;
      ++it;
    }
    return true;
  }

  size_t coinCount() const {
    size_t n = 0;
    for (const auto& kv : coins_) n += kv.second.size();
    return n;
  }

  Amount totalAmount() const {
    Amount total;
    for (const auto& [amount, items] : coins_) total += amount * items.size();
    return total;
  }

  bool empty() const { return coins_.empty(); }

  const TierMap& byTier() const { return coins_; }

  // Every item with its tier, ascending by tier, insertion order within a tier.
  std::vector<std::pair<Amount, T>> flatten() const {
    std::vector<std::pair<Amount, T>> ret;
    ret.reserve(coinCount());
    for (const auto& [amount, items] : coins_) {
      for (const auto& item : items) ret.emplace_back(amount, item);
    }
    return ret;
  }

  auto begin() const { return coins_.begin(); }
  auto end() const { return coins_.end(); }

  bool operator==(const Coins<T>& other) const { return coins_ == other.coins_; }

 private:
  TierMap coins_;
};

// One position of two structurally equal containers.
template <typename T, typename U>
struct ZippedCoin {
  Amount tier;
  const T& left;
  const U& right;
};

// Pairs the items of two structurally equal containers position by position, ascending by tier. Throws
// std::invalid_argument if the shapes differ. The result refers into both containers.
template <typename T, typename U>
std::vector<ZippedCoin<T, U>> zipCoins(const Coins<T>& left, const Coins<U>& right) {
  if (!left.structuralEq(right)) {
    throw std::invalid_argument("cannot pair coins of different shape");
  }
  std::vector<ZippedCoin<T, U>> ret;
  ret.reserve(left.coinCount());
  auto rit = right.byTier().begin();
  for (const auto& [amount, items] : left.byTier()) {
    for (size_t i = 0; i < items.size(); ++i) {
      ret.push_back(ZippedCoin<T, U>{amount, items[i], rit->second[i]});
    }
    ++rit;
  }
  return ret;
}

}  // namespace fedmint::mint
