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

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "mint/types.h"
#include "mintclient/issuance.h"
#include "storage/db_interface.h"
#include "storage/prefix_range.h"

namespace fedmint::client {

struct PendingIssuance {
  mint::TransactionId id;
  IssuanceRequest request;
};

struct OwnedCoin {
  mint::Amount amount;
  SpendableCoin coin;
};

// A PrefixRange whose entries are decoded into typed records as they are read. Decoding failures throw DecodingError.
template <typename Record>
class RecordRange {
 public:
  using Decoder = std::function<Record(const storage::KeyValuePair&)>;

  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Record;
    using difference_type = std::ptrdiff_t;
    using pointer = const Record*;
    using reference = Record;

    Record operator*() const { return (*decode_)(*it_); }
    Iterator& operator++() {
      ++it_;
      return *this;
    }
    bool operator==(const Iterator& other) const { return it_ == other.it_; }
    bool operator!=(const Iterator& other) const { return it_ != other.it_; }

   private:
    friend class RecordRange;
    Iterator(storage::PrefixRange::Iterator it, const Decoder* decode) : it_(std::move(it)), decode_(decode) {}

    storage::PrefixRange::Iterator it_;
    const Decoder* decode_;
  };

  RecordRange(storage::PrefixRange range, Decoder decode) : range_(std::move(range)), decode_(std::move(decode)) {}

  Iterator begin() const { return Iterator(range_.begin(), &decode_); }
  Iterator end() const { return Iterator(range_.end(), &decode_); }

  std::vector<Record> toVector() const {
    std::vector<Record> ret;
    for (auto&& r : *this) ret.push_back(std::move(r));
    return ret;
  }

 private:
  storage::PrefixRange range_;
  Decoder decode_;
};

// Coins to add and pending issuances to remove in one atomic step.
struct RedeemBatch {
  mint::Coins<SpendableCoin> coins;
  std::vector<mint::TransactionId> issuances;
};

// Crash-safe persistence of pending issuances and owned coins on top of an IDBClient.
//
// A pending issuance is written before its peg-in is broadcast and removed only in the same transaction that stores
// the coins it produced. Storage failures throw storage::StorageException and leave the store as it was.
class CoinStore {
 public:
  explicit CoinStore(std::shared_ptr<storage::IDBClient> db);

  void recordPending(const mint::TransactionId& id, const IssuanceRequest& request);
  std::optional<IssuanceRequest> getPending(const mint::TransactionId& id) const;

  void commitRedeemed(const RedeemBatch& batch);

  // Each begin() scans the store as it is at that moment. Coins come in ascending tier order.
  RecordRange<PendingIssuance> listPending() const;
  RecordRange<OwnedCoin> listOwnedCoins() const;

  // Deletes exactly the given coins in one transaction.
  void spend(const mint::Coins<SpendableCoin>& coins);

 private:
  std::shared_ptr<storage::IDBClient> db_;
};

}  // namespace fedmint::client
