// Copyright 2022 VMware, all rights reserved

#pragma once

#include "storage/db_interface.h"

#include <cstddef>
#include <iterator>
#include <memory>

namespace fedmint::storage {

// The key-value pairs whose key starts with a prefix, in ascending key order.
//
// Nothing is read until begin() is called, and every begin() starts a fresh scan, so a range can be walked more
// than once. Scanning stops at the first key outside the prefix. A read error during the scan throws
// StorageException.
class PrefixRange {
 public:
  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = KeyValuePair;
    using difference_type = std::ptrdiff_t;
    using pointer = const KeyValuePair*;
    using reference = const KeyValuePair&;

    Iterator() = default;

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }

    Iterator& operator++() {
      advance(iter_->next());
      return *this;
    }

    // Two iterators compare equal only when both are exhausted.
    bool operator==(const Iterator& other) const { return !iter_ && !other.iter_; }
    bool operator!=(const Iterator& other) const { return !(*this == other); }

   private:
    friend class PrefixRange;

    Iterator(std::shared_ptr<IDBClient::IDBClientIterator> iter, Sliver prefix)
        : iter_(std::move(iter)), prefix_(std::move(prefix)) {
      advance(iter_->seekAtLeast(prefix_));
    }

    void advance(KeyValuePair kv) {
      if (!iter_->valid()) {
        checkStatus();
        iter_.reset();
        return;
      }
      checkStatus();
      if (!kv.first.startsWith(prefix_)) {
        iter_.reset();
        return;
      }
      current_ = std::move(kv);
    }

    void checkStatus() const {
      const auto status = iter_->getStatus();
      if (!status.isOK() && !status.isNotFound()) {
        throw StorageException("prefix scan failed: " + status.toString());
      }
    }

    std::shared_ptr<IDBClient::IDBClientIterator> iter_;
    Sliver prefix_;
    KeyValuePair current_;
  };

  PrefixRange(const IDBClient& db, Sliver prefix) : db_(db), prefix_(std::move(prefix)) {}

  Iterator begin() const { return Iterator(db_.getIterator(), prefix_); }
  Iterator end() const { return Iterator(); }

 private:
  const IDBClient& db_;
  Sliver prefix_;
};

}  // namespace fedmint::storage
