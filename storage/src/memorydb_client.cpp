// Copyright 2018-2022 VMware, all rights reserved

#include "memorydb/client.h"
#include "memorydb/transaction.h"

#include <atomic>
#include <new>

namespace fedmint::storage::memorydb {

void Client::init(bool readOnly) { readOnly_ = readOnly; }

std::shared_ptr<const TKVStore> Client::snapshot() const {
  auto lock = std::lock_guard{mutex_};
  return map_;
}

/**
 * @brief Services a read request from the In Memory Database.
 *
 * @return Status NotFound if no mapping is found, else, Status OK.
 */
Status Client::get(const Sliver &_key, Sliver &_outValue) const {
  const auto map = snapshot();
  auto it = map->find(_key);
  if (it == map->end()) {
    return Status::NotFound("key not found");
  }
  _outValue = it->second;
  return Status::OK();
}

Status Client::has(const Sliver &_key) const {
  Sliver dummy_out;
  return get(_key, dummy_out);
}

std::unique_ptr<IDBClient::IDBClientIterator> Client::getIterator() const {
  return std::make_unique<ClientIterator>(snapshot());
}

Status Client::put(const Sliver &_key, const Sliver &_value) {
  WriteBatch batch;
  batch[_key] = WriteOperation{false, _value};
  try {
    apply(batch);
  } catch (const StorageException &e) {
    return Status::GeneralError(e.what());
  }
  return Status::OK();
}

Status Client::del(const Sliver &_key) {
  WriteBatch batch;
  batch[_key] = WriteOperation{true, Sliver{}};
  try {
    apply(batch);
  } catch (const StorageException &e) {
    return Status::GeneralError(e.what());
  }
  return Status::OK();
}

void Client::apply(const WriteBatch &batch) {
  if (readOnly_) {
    throw StorageException("memorydb opened read-only");
  }
  auto lock = std::lock_guard{mutex_};
  std::shared_ptr<TKVStore> next;
  try {
    next = std::make_shared<TKVStore>(*map_);
    for (const auto &[key, op] : batch) {
      if (op.isDelete) {
        next->erase(key);
      } else {
        next->insert_or_assign(key, op.value);
      }
    }
  } catch (const std::bad_alloc &) {
    LOG_ERROR(logger, "Out of memory applying a batch of " << batch.size() << " updates");
    throw StorageException("out of memory applying batch");
  }
  map_ = std::move(next);
  LOG_TRACE(logger, "Applied batch of " << batch.size() << " updates, size=" << map_->size());
}

std::unique_ptr<ITransaction> Client::startTransaction() {
  static std::atomic_uint64_t current_transaction_id{0};
  return std::make_unique<Transaction>(*this, ++current_transaction_id);
}

KeyValuePair ClientIterator::current() {
  m_status = Status::OK();
  if (m_current == snapshot_->end()) {
    m_status = Status::NotFound("end of map");
    return KeyValuePair();
  }
  return KeyValuePair(m_current->first, m_current->second);
}

KeyValuePair ClientIterator::seekAtLeast(const Sliver &_searchKey) {
  m_current = snapshot_->lower_bound(_searchKey);
  return current();
}

KeyValuePair ClientIterator::next() {
  if (m_current == snapshot_->end()) {
    m_status = Status::GeneralError("Iterator is not valid");
    return KeyValuePair();
  }
  ++m_current;
  return current();
}

KeyValuePair ClientIterator::getCurrent() { return current(); }

}  // namespace fedmint::storage::memorydb
