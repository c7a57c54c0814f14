// Copyright 2022 VMware, all rights reserved

#pragma once

#include "sliver.hpp"
#include "status.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#define OUT

namespace fedmint::storage {

using util::Sliver;
using util::Status;

typedef std::pair<Sliver, Sliver> KeyValuePair;

// Raised when the underlying store fails to read or write. A failed commit leaves the store unchanged.
class StorageException : public std::runtime_error {
 public:
  explicit StorageException(const std::string& what) : std::runtime_error("storage error: " + what) {}
};

// A batch of writes that becomes visible all at once.
class ITransaction {
 public:
  typedef uint64_t ID;
  ITransaction(ID id) : id_(id) {}
  virtual ~ITransaction() = default;

  // Applies every buffered put and del atomically. Throws StorageException if nothing was applied.
  virtual void commit() = 0;
  virtual void rollback() = 0;
  virtual void put(const Sliver& key, const Sliver& value) = 0;
  // Reads through the buffered writes first.
  virtual std::optional<Sliver> get(const Sliver& key) = 0;
  virtual void del(const Sliver& key) = 0;

  ID getId() const { return id_; }
  std::string getIdStr() const { return std::to_string(id_); }

 private:
  ID id_;
};

class IDBClient {
 public:
  typedef std::shared_ptr<IDBClient> ptr;
  virtual ~IDBClient() = default;
  virtual void init(bool readOnly = false) = 0;
  virtual Status get(const Sliver& _key, OUT Sliver& _outValue) const = 0;
  virtual Status has(const Sliver& _key) const = 0;
  virtual Status put(const Sliver& _key, const Sliver& _value) = 0;
  virtual Status del(const Sliver& _key) = 0;

  virtual std::unique_ptr<ITransaction> startTransaction() = 0;

  class IDBClientIterator {
   public:
    // Positions at the first key that is not less than _searchKey.
    virtual KeyValuePair seekAtLeast(const Sliver& _searchKey) = 0;
    virtual KeyValuePair next() = 0;
    virtual KeyValuePair getCurrent() = 0;
    // Iterators are initially invalid. A positioning call makes them valid if it lands on a key.
    virtual bool valid() const = 0;
    // Status of the last operation. Running off the end is not an error.
    virtual Status getStatus() const = 0;
    virtual ~IDBClientIterator() = default;
  };

  virtual std::unique_ptr<IDBClientIterator> getIterator() const = 0;
};

}  // namespace fedmint::storage
