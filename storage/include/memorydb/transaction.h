// Copyright 2020-2022 VMware, all rights reserved

#pragma once

#include "client.h"
#include "sliver.hpp"
#include "storage/db_interface.h"

#include <optional>

namespace fedmint::storage::memorydb {

// Buffers writes and hands them to the client as one batch on commit.
class Transaction : public ITransaction {
 public:
  Transaction(Client& client, ITransaction::ID id) : ITransaction{id}, client_{client} {}

  void commit() override {
    client_.apply(updates_);
    updates_.clear();
  }

  void rollback() override { updates_.clear(); }

  void put(const Sliver& key, const Sliver& value) override { updates_[key] = WriteOperation{false, value}; }

  std::optional<Sliver> get(const Sliver& key) override {
    auto it = updates_.find(key);
    if (it != updates_.cend()) {
      if (it->second.isDelete) return std::nullopt;
      return it->second.value;
    }
    Sliver val;
    const auto status = client_.get(key, val);
    if (status.isNotFound()) return std::nullopt;
    if (!status.isOK()) throw StorageException("memorydb transaction " + getIdStr() + ": " + status.toString());
    return val;
  }

  void del(const Sliver& key) override { updates_[key] = WriteOperation{true, Sliver{}}; }

 private:
  Client& client_;
  WriteBatch updates_;
};

}  // namespace fedmint::storage::memorydb
