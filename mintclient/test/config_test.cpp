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

#include "gtest/gtest.h"

#include <string>

#include "fake_mint.h"
#include "hex_tools.h"
#include "mintclient/config.h"
#include "mintclient/exception.h"

using namespace fedmint::client;
using fedmint::client::test::Federation;
using fedmint::mint::Amount;

namespace {

class config : public ::testing::Test {
 protected:
  std::string keyHex(uint64_t tier) const {
    return fedmint::util::vectorToHex(federation.keys.tier(Amount(tier)).toBytes());
  }

  std::string mintPk() const {
    return "mint_pk:\n  - {amount: 1, key: \"" + keyHex(1) + "\"}\n  - {amount: 2, key: \"" + keyHex(2) + "\"}\n";
  }

  Federation federation = Federation::create({1, 2});
};

TEST_F(config, full_file) {
  const auto cfg = parseConfig(YAML::Load("mints: [\"http://a:5000\", \"http://b:5000\"]\n"
                                          "f_val: 0\n"
                                          "db_path: /tmp/fedmint\n"
                                          "connect_timeout_ms: 100\n"
                                          "read_timeout_ms: 200\n" +
                                          mintPk()));
  ASSERT_EQ((std::vector<std::string>{"http://a:5000", "http://b:5000"}), cfg.mints);
  ASSERT_EQ(0, *cfg.f_val);
  ASSERT_EQ("/tmp/fedmint", cfg.db_path);
  ASSERT_EQ(std::chrono::milliseconds(100), cfg.connect_timeout);
  ASSERT_EQ(std::chrono::milliseconds(200), cfg.read_timeout);
  ASSERT_EQ(2u, cfg.mint_pk.size());
  ASSERT_EQ(federation.keys.tier(Amount(2)), cfg.mint_pk.tier(Amount(2)));
}

TEST_F(config, optional_fields_default) {
  const auto cfg = parseConfig(YAML::Load("mints: [\"http://a:5000\"]\ndb_path: /tmp/fedmint\n" + mintPk()));
  ASSERT_FALSE(cfg.f_val.has_value());
  ASSERT_EQ(std::chrono::milliseconds(5000), cfg.connect_timeout);
  ASSERT_EQ(std::chrono::milliseconds(10000), cfg.read_timeout);
}

TEST_F(config, missing_or_empty_mints) {
  ASSERT_THROW(parseConfig(YAML::Load("db_path: /tmp/fedmint\n" + mintPk())), ConfigurationException);
  ASSERT_THROW(parseConfig(YAML::Load("mints: []\ndb_path: /tmp/fedmint\n" + mintPk())), ConfigurationException);
}

TEST_F(config, store_path_is_required) {
  ASSERT_THROW(parseConfig(YAML::Load("mints: [\"http://a:5000\"]\n" + mintPk())), ConfigurationException);
  ASSERT_THROW(parseConfig(YAML::Load("mints: [\"http://a:5000\"]\ndb_path: \"\"\n" + mintPk())),
               ConfigurationException);
}

TEST_F(config, bad_mint_keys) {
  const std::string head = "mints: [\"http://a\"]\ndb_path: /tmp/fedmint\n";
  ASSERT_THROW(parseConfig(YAML::Load(head)), ConfigurationException);
  ASSERT_THROW(parseConfig(YAML::Load(head + "mint_pk: []\n")), ConfigurationException);
  ASSERT_THROW(parseConfig(YAML::Load(head + "mint_pk:\n  - {amount: 1, key: \"abcd\"}\n")), ConfigurationException);
  ASSERT_THROW(parseConfig(YAML::Load(head + "mint_pk:\n  - {amount: 1, key: \"" + keyHex(1) +
                                      "\"}\n  - {amount: 1, key: \"" + keyHex(2) + "\"}\n")),
               ConfigurationException);
  ASSERT_THROW(parseConfig(YAML::Load(head + "mint_pk:\n  - {amount: x, key: \"" + keyHex(1) + "\"}\n")),
               ConfigurationException);
}

TEST_F(config, unreadable_file) { ASSERT_THROW(loadConfig("/nonexistent/fedmint.yaml"), ConfigurationException); }

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
