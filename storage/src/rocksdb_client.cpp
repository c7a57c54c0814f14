// Copyright 2018-2022 VMware, all rights reserved

/**
 * @file rocksdb_client.cpp
 *
 * Wrappers around RocksDB functions for standard database operations, and the iterator used for prefix scans.
 */

#ifdef USE_ROCKSDB

#include "rocksdb/client.h"
#include "rocksdb/transaction.h"

#include <rocksdb/options.h>

#include <atomic>

namespace fedmint::storage::rocksdb {

::rocksdb::Slice toRocksdbSlice(const Sliver &_s) { return ::rocksdb::Slice(_s.data(), _s.length()); }

// The bytes behind a slice belong to the iterator and are invalidated when it moves, so they are copied out.
Sliver copyRocksdbSlice(::rocksdb::Slice _s) { return Sliver::copy(_s.data(), _s.size()); }

// Every write reaches the disk before it is acknowledged.
::rocksdb::WriteOptions syncedWrites() {
  ::rocksdb::WriteOptions wo;
  wo.sync = true;
  return wo;
}

std::unique_ptr<ITransaction> Client::startTransaction() {
  static std::atomic_uint64_t current_transaction_id(0);
  if (!txn_db_) throw StorageException("Failed to start transaction, reason: RO mode");
  return std::make_unique<Transaction>(txn_db_->BeginTransaction(syncedWrites()), ++current_transaction_id);
}

/**
 * @brief Opens a RocksDB database, creating it if missing.
 *
 * @throw StorageException if the database cannot be opened.
 */
void Client::init(bool readOnly) {
  if (initialized_) {
    return;
  }
  ::rocksdb::Options options;
  options.create_if_missing = true;
  ::rocksdb::Status s;
  if (readOnly) {
    ::rocksdb::DB *db;
    s = ::rocksdb::DB::OpenForReadOnly(options, m_dbPath, &db);
    if (!s.ok()) throw StorageException("Failed to open rocksdb database at " + m_dbPath + " reason: " + s.ToString());
    dbInstance_.reset(db);
  } else {
    s = ::rocksdb::OptimisticTransactionDB::Open(options, m_dbPath, &txn_db_);
    if (!s.ok()) throw StorageException("Failed to open rocksdb database at " + m_dbPath + " reason: " + s.ToString());
    dbInstance_.reset(txn_db_->GetBaseDB());
  }
  LOG_INFO(logger(), "Opened rocksdb database at " << m_dbPath << (readOnly ? " (read-only)" : ""));
  initialized_ = true;
}

/**
 * @brief Services a read request from the RocksDB database.
 *
 * @return Status NotFound if key is not present, Status GeneralError if error in Get, else Status OK.
 */
Status Client::get(const Sliver &_key, Sliver &_outValue) const {
  std::string value;
  ::rocksdb::Status s = dbInstance_->Get(::rocksdb::ReadOptions(), toRocksdbSlice(_key), &value);
  if (s.IsNotFound()) {
    return Status::NotFound("Not found");
  }
  if (!s.ok()) {
    LOG_ERROR(logger(), "Failed to get key " << _key << " due to " << s.ToString());
    return Status::GeneralError("Failed to read key");
  }
  _outValue = Sliver(std::move(value));
  return Status::OK();
}

Status Client::has(const Sliver &_key) const {
  Sliver dummy_out;
  return get(_key, dummy_out);
}

std::unique_ptr<IDBClient::IDBClientIterator> Client::getIterator() const {
  return std::make_unique<ClientIterator>(this, logger());
}

::rocksdb::Iterator *Client::getNewRocksDbIterator() const {
  return dbInstance_->NewIterator(::rocksdb::ReadOptions());
}

Status Client::put(const Sliver &_key, const Sliver &_value) {
  ::rocksdb::Status s = dbInstance_->Put(syncedWrites(), toRocksdbSlice(_key), toRocksdbSlice(_value));
  LOG_TRACE(logger(), "Rocksdb Put " << _key);
  if (!s.ok()) {
    LOG_ERROR(logger(), "Failed to put key " << _key << ", Error: " << s.ToString());
    return Status::GeneralError("Failed to put key");
  }
  return Status::OK();
}

Status Client::del(const Sliver &_key) {
  ::rocksdb::Status s = dbInstance_->Delete(syncedWrites(), toRocksdbSlice(_key));
  LOG_TRACE(logger(), "Rocksdb delete " << _key);
  if (!s.ok()) {
    LOG_ERROR(logger(), "Failed to delete key " << _key << ", Error: " << s.ToString());
    return Status::GeneralError("Failed to delete key");
  }
  return Status::OK();
}

ClientIterator::ClientIterator(const Client *_parentClient, logging::Logger logger)
    : logger(logger), m_iter(_parentClient->getNewRocksDbIterator()), m_status(Status::OK()) {}

// Reads the pair under the iterator. Running off the end sets NotFound, an iterator error sets GeneralError.
KeyValuePair ClientIterator::current() {
  if (!m_iter->Valid()) {
    const auto s = m_iter->status();
    if (!s.ok()) {
      LOG_ERROR(logger, "RocksDB iterator failed: " << s.ToString());
      m_status = Status::GeneralError(s.ToString());
    } else {
      m_status = Status::NotFound("No more keys");
    }
    return KeyValuePair();
  }
  m_status = Status::OK();
  return KeyValuePair(copyRocksdbSlice(m_iter->key()), copyRocksdbSlice(m_iter->value()));
}

KeyValuePair ClientIterator::seekAtLeast(const Sliver &_searchKey) {
  m_iter->Seek(toRocksdbSlice(_searchKey));
  return current();
}

KeyValuePair ClientIterator::next() {
  if (!m_iter->Valid()) {
    LOG_ERROR(logger, "Iterator is not valid");
    m_status = Status::GeneralError("Iterator is not valid");
    return KeyValuePair();
  }
  m_iter->Next();
  return current();
}

KeyValuePair ClientIterator::getCurrent() { return current(); }

}  // namespace fedmint::storage::rocksdb

#endif
