// Fedmint
//
// Copyright (c) 2019-2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the sub-component's license, as noted in the
// LICENSE file.

#pragma once

#ifdef USE_ROCKSDB

#include <rocksdb/utilities/transaction.h>
#include "storage/db_interface.h"
#include "client.h"
#include "Logger.hpp"

namespace fedmint::storage::rocksdb {

#define ROCKSDB_THROW(action, status) \
  throw StorageException("rocksdb " action " failed, txn id[" + getIdStr() + "], reason: " + (status).ToString())

class Transaction : public ITransaction {
 public:
  Transaction(::rocksdb::Transaction* txn, ID id) : ITransaction(id), txn_(txn) {}
  void commit() override {
    LOG_DEBUG(logger(), "commit txn: " << getId());
    ::rocksdb::Status s = txn_->Commit();
    if (!s.ok()) ROCKSDB_THROW("Commit", s);
  }
  void rollback() override {
    LOG_DEBUG(logger(), "rollback txn: " << getId());
    ::rocksdb::Status s = txn_->Rollback();
    if (!s.ok()) ROCKSDB_THROW("Rollback", s);
  }
  void put(const Sliver& key, const Sliver& value) override {
    LOG_TRACE(logger(), "put txn: " << getId() << " key:" << key);
    ::rocksdb::Status s = txn_->Put(toRocksdbSlice(key), toRocksdbSlice(value));
    if (!s.ok()) ROCKSDB_THROW("Put", s);
  }
  std::optional<Sliver> get(const Sliver& key) override {
    std::string val;
    ::rocksdb::Status s = txn_->Get(::rocksdb::ReadOptions(), toRocksdbSlice(key), &val);
    if (s.IsNotFound()) return std::nullopt;
    if (!s.ok()) ROCKSDB_THROW("Get", s);
    return Sliver(std::move(val));
  }
  void del(const Sliver& key) override {
    LOG_TRACE(logger(), "del txn: " << getId() << " key:" << key);
    ::rocksdb::Status s = txn_->Delete(toRocksdbSlice(key));
    if (!s.ok()) ROCKSDB_THROW("Delete", s);
  }

 protected:
  logging::Logger& logger() {
    static logging::Logger logger_ = logging::getLogger("fedmint.storage.rocksdb.transaction");
    return logger_;
  }
  std::unique_ptr<::rocksdb::Transaction> txn_;
};

}  // namespace fedmint::storage::rocksdb

#endif
