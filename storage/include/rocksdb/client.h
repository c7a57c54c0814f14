// Copyright 2018-2022 VMware, all rights reserved

/**
 * @file client.h
 *
 * Objects of ClientIterator wrap a RocksDB iterator together with a pointer to the client.
 *
 * Objects of Client own a connection to a RocksDB database opened as an OptimisticTransactionDB, so transactions
 * commit atomically.
 */

#pragma once

#ifdef USE_ROCKSDB

#include "Logger.hpp"
#include "storage/db_interface.h"

#include <rocksdb/db.h>
#include <rocksdb/utilities/optimistic_transaction_db.h>

#include <memory>
#include <string>

namespace fedmint::storage::rocksdb {

::rocksdb::Slice toRocksdbSlice(const Sliver& _s);
Sliver copyRocksdbSlice(::rocksdb::Slice _s);

class Client;

class ClientIterator : public IDBClient::IDBClientIterator {
 public:
  ClientIterator(const Client* _parentClient, logging::Logger);

  KeyValuePair seekAtLeast(const Sliver& _searchKey) override;
  KeyValuePair next() override;
  KeyValuePair getCurrent() override;
  bool valid() const override { return m_iter->Valid(); }
  Status getStatus() const override { return m_status; }

 private:
  KeyValuePair current();

  logging::Logger logger;
  std::unique_ptr<::rocksdb::Iterator> m_iter;
  Status m_status;
};

class Client : public IDBClient {
 public:
  Client(const std::string& _dbPath) : m_dbPath(_dbPath) {}

  ~Client() {
    if (txn_db_) {
      // The TransactionDB wraps the base DB, so release it instead of the base DB.
      (void)dbInstance_.release();
      delete txn_db_;
    }
  }

  void init(bool readOnly = false) override;
  Status get(const Sliver& _key, Sliver& _outValue) const override;
  Status has(const Sliver& _key) const override;
  Status put(const Sliver& _key, const Sliver& _value) override;
  Status del(const Sliver& _key) override;
  std::unique_ptr<ITransaction> startTransaction() override;
  std::unique_ptr<IDBClientIterator> getIterator() const override;

  ::rocksdb::Iterator* getNewRocksDbIterator() const;
  const std::string& getPath() const { return m_dbPath; }

  static logging::Logger& logger() {
    static logging::Logger logger_ = logging::getLogger("fedmint.storage.rocksdb");
    return logger_;
  }

 private:

  bool initialized_{false};
  std::string m_dbPath;
  std::unique_ptr<::rocksdb::DB> dbInstance_;
  ::rocksdb::OptimisticTransactionDB* txn_db_ = nullptr;
};

}  // namespace fedmint::storage::rocksdb

#endif
