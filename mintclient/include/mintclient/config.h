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

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "mintclient/issuance.h"

namespace fedmint::client {

struct ClientConfig {
  std::vector<std::string> mints;
  std::optional<uint16_t> f_val;
  // RocksDB directory holding pending issuances and coins. Every command runs as its own process, so the store
  // must outlive it.
  std::string db_path;
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds read_timeout{10000};
  // The federation's aggregate public key per tier.
  MintKeys mint_pk;
};

// Throws ConfigurationException on a missing or invalid field.
ClientConfig parseConfig(const YAML::Node& yaml);
ClientConfig loadConfig(const std::string& path);

}  // namespace fedmint::client
