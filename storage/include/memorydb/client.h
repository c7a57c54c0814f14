// Copyright 2018-2022 VMware, all rights reserved

// Objects of Client are implementations of an in memory database (implemented as a map of Sliver to Sliver, in
// bytewise key order).
//
// The map is copy-on-write: readers and iterators hold an immutable snapshot, and every write installs a new map.
// That makes a committed transaction visible all at once and keeps open iterators stable while writes happen.

#pragma once

#include "Logger.hpp"
#include "sliver.hpp"
#include "storage/db_interface.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace fedmint::storage::memorydb {

typedef std::map<Sliver, Sliver> TKVStore;

// A buffered write.
struct WriteOperation {
  bool isDelete{false};
  Sliver value;
};

typedef std::map<Sliver, WriteOperation> WriteBatch;

class ClientIterator : public IDBClient::IDBClientIterator {
 public:
  ClientIterator(std::shared_ptr<const TKVStore> snapshot)
      : snapshot_(std::move(snapshot)), m_current(snapshot_->end()) {}

  KeyValuePair seekAtLeast(const Sliver &_searchKey) override;
  KeyValuePair next() override;
  KeyValuePair getCurrent() override;
  bool valid() const override { return m_current != snapshot_->end(); }
  Status getStatus() const override { return m_status; }

 private:
  KeyValuePair current();

  std::shared_ptr<const TKVStore> snapshot_;
  TKVStore::const_iterator m_current;
  Status m_status = Status::OK();
};

// Thread-safe. Each operation takes a short lock to read or swap the current snapshot.
class Client : public IDBClient {
 public:
  Client() : logger(logging::getLogger("fedmint.storage.memorydb")), map_(std::make_shared<const TKVStore>()) {}

  void init(bool readOnly = false) override;
  Status get(const Sliver &_key, OUT Sliver &_outValue) const override;
  Status has(const Sliver &_key) const override;
  Status put(const Sliver &_key, const Sliver &_value) override;
  Status del(const Sliver &_key) override;
  std::unique_ptr<ITransaction> startTransaction() override;
  std::unique_ptr<IDBClientIterator> getIterator() const override;

  // Installs every update in one step. Throws StorageException and leaves the map untouched on failure.
  void apply(const WriteBatch &batch);

  size_t size() const { return snapshot()->size(); }

 private:
  std::shared_ptr<const TKVStore> snapshot() const;

  logging::Logger logger;
  mutable std::mutex mutex_;
  std::shared_ptr<const TKVStore> map_;
  bool readOnly_{false};
};

}  // namespace fedmint::storage::memorydb
