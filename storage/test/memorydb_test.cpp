// Copyright 2022 VMware, all rights reserved

#include "gtest/gtest.h"

#include "memorydb/client.h"
#include "storage/prefix_range.h"
#include "storage/test/storage_test_common.h"

#include <string>
#include <vector>

using namespace fedmint::storage;
using fedmint::util::Sliver;

namespace {

Sliver s(const std::string& str) { return Sliver(std::string(str)); }

std::vector<std::string> keysOf(const PrefixRange& range) {
  std::vector<std::string> keys;
  for (const auto& kv : range) {
    keys.push_back(kv.first.toString());
  }
  return keys;
}

TEST(memorydb, get_put_del) {
  auto db = TestMemoryDb::create();
  Sliver out;
  ASSERT_TRUE(db->get(s("a"), out).isNotFound());
  ASSERT_TRUE(db->put(s("a"), s("1")).isOK());
  ASSERT_TRUE(db->get(s("a"), out).isOK());
  ASSERT_EQ("1", out.toString());
  ASSERT_TRUE(db->has(s("a")).isOK());
  ASSERT_TRUE(db->del(s("a")).isOK());
  ASSERT_TRUE(db->has(s("a")).isNotFound());
}

TEST(memorydb, read_only_rejects_writes) {
  auto db = std::make_shared<memorydb::Client>();
  db->init(true);
  ASSERT_FALSE(db->put(s("a"), s("1")).isOK());
  auto txn = db->startTransaction();
  txn->put(s("a"), s("1"));
  ASSERT_THROW(txn->commit(), StorageException);
}

TEST(memorydb, transaction_is_invisible_until_commit) {
  auto db = TestMemoryDb::create();
  ASSERT_TRUE(db->put(s("gone"), s("x")).isOK());

  auto txn = db->startTransaction();
  txn->put(s("k1"), s("v1"));
  txn->put(s("k2"), s("v2"));
  txn->del(s("gone"));
  ASSERT_EQ("v1", txn->get(s("k1"))->toString());
  ASSERT_FALSE(txn->get(s("gone")).has_value());
  ASSERT_TRUE(db->has(s("k1")).isNotFound());
  ASSERT_TRUE(db->has(s("gone")).isOK());

  txn->commit();
  ASSERT_TRUE(db->has(s("k1")).isOK());
  ASSERT_TRUE(db->has(s("k2")).isOK());
  ASSERT_TRUE(db->has(s("gone")).isNotFound());
}

TEST(memorydb, rollback_discards_updates) {
  auto db = TestMemoryDb::create();
  auto txn = db->startTransaction();
  txn->put(s("k"), s("v"));
  txn->rollback();
  txn->commit();
  ASSERT_EQ(0u, db->size());
}

TEST(memorydb, failed_commit_leaves_store_unchanged) {
  auto mem = TestMemoryDb::create();
  auto db = FailingCommitDb(mem);
  ASSERT_TRUE(db.put(s("keep"), s("1")).isOK());
  db.failCommits(true);

  auto txn = db.startTransaction();
  txn->put(s("new"), s("2"));
  txn->del(s("keep"));
  ASSERT_THROW(txn->commit(), StorageException);
  ASSERT_TRUE(db.has(s("keep")).isOK());
  ASSERT_TRUE(db.has(s("new")).isNotFound());
}

TEST(prefix_range, yields_only_matching_keys_in_order) {
  auto db = TestMemoryDb::create();
  for (const auto* key : {"a1", "b2", "b1", "b", "c"}) {
    ASSERT_TRUE(db->put(s(key), s("")).isOK());
  }

  ASSERT_EQ((std::vector<std::string>{"b", "b1", "b2"}), keysOf(PrefixRange(*db, s("b"))));
  ASSERT_TRUE(keysOf(PrefixRange(*db, s("d"))).empty());
  ASSERT_EQ(5u, keysOf(PrefixRange(*db, Sliver())).size());
}

TEST(prefix_range, is_lazy_and_restartable) {
  auto db = TestMemoryDb::create();
  const auto range = PrefixRange(*db, s("p"));
  // Created before the data exists, read afterwards.
  ASSERT_TRUE(db->put(s("p1"), s("")).isOK());
  ASSERT_EQ(1u, keysOf(range).size());
  ASSERT_TRUE(db->put(s("p2"), s("")).isOK());
  ASSERT_EQ(2u, keysOf(range).size());
}

TEST(prefix_range, scan_sees_a_stable_snapshot) {
  auto db = TestMemoryDb::create();
  ASSERT_TRUE(db->put(s("p1"), s("")).isOK());
  ASSERT_TRUE(db->put(s("p2"), s("")).isOK());
  const auto range = PrefixRange(*db, s("p"));
  auto it = range.begin();
  ASSERT_TRUE(db->del(s("p1")).isOK());
  ASSERT_TRUE(db->del(s("p2")).isOK());
  ASSERT_EQ("p1", it->first.toString());
  ++it;
  ASSERT_EQ("p2", it->first.toString());
  ++it;
  ASSERT_TRUE(it == range.end());
}

}  // namespace
