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

#include "mintclient/config.h"

#include <sstream>

#include "Logger.hpp"
#include "hex_tools.h"
#include "mintclient/exception.h"

namespace fedmint::client {

static auto logger = logging::getLogger("fedmint.client.config");

// Copy a value from the YAML node to `out`.
// Throws ConfigurationException if no value could be read but the value is required.
template <typename T>
static void readYamlField(const YAML::Node& yaml, const std::string& index, T& out, bool value_required = true) {
  if (!yaml[index]) {
    if (value_required) throw ConfigurationException("missing \"" + index + "\"");
    LOG_INFO(logger, "No value found for \"" << index << "\"");
    return;
  }
  try {
    out = yaml[index].as<T>();
  } catch (const YAML::Exception& e) {
    std::ostringstream msg;
    msg << "failed to read \"" << index << "\"";
    throw ConfigurationException(msg.str());
  }
}

static void readYamlField(const YAML::Node& yaml,
                          const std::string& index,
                          std::chrono::milliseconds& out,
                          bool value_required = true) {
  uint64_t ms = out.count();
  readYamlField(yaml, index, ms, value_required);
  out = std::chrono::milliseconds(ms);
}

template <typename T>
static void readYamlField(const YAML::Node& yaml, const std::string& index, std::optional<T>& out) {
  T value{};
  if (!yaml[index]) {
    LOG_INFO(logger, "No value found for \"" << index << "\"");
    return;
  }
  readYamlField(yaml, index, value);
  out = std::move(value);
}

static MintKeys parseMintKeys(const YAML::Node& yaml) {
  const auto& node = yaml["mint_pk"];
  if (!node || !node.IsSequence() || node.size() == 0) {
    throw ConfigurationException("\"mint_pk\" must be a non-empty list");
  }
  MintKeys keys;
  for (const auto& entry : node) {
    uint64_t amount = 0;
    std::string hex;
    readYamlField(entry, "amount", amount);
    readYamlField(entry, "key", hex);
    tbs::AggregatePublicKey pk;
    try {
      pk = tbs::AggregatePublicKey::fromBytes(util::unhex(hex));
    } catch (const std::invalid_argument& e) {
      throw ConfigurationException("invalid key for tier " + std::to_string(amount) + ": " + e.what());
    }
    if (!keys.insert(mint::Amount(amount), std::move(pk))) {
      throw ConfigurationException("duplicate tier " + std::to_string(amount) + " in \"mint_pk\"");
    }
  }
  return keys;
}

ClientConfig parseConfig(const YAML::Node& yaml) {
  ClientConfig config;
  readYamlField(yaml, "mints", config.mints);
  if (config.mints.empty()) {
    throw ConfigurationException("\"mints\" must not be empty");
  }
  readYamlField(yaml, "f_val", config.f_val);
  readYamlField(yaml, "db_path", config.db_path);
  if (config.db_path.empty()) {
    throw ConfigurationException("\"db_path\" must not be empty");
  }
  readYamlField(yaml, "connect_timeout_ms", config.connect_timeout, false);
  readYamlField(yaml, "read_timeout_ms", config.read_timeout, false);
  config.mint_pk = parseMintKeys(yaml);
  return config;
}

ClientConfig loadConfig(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigurationException("cannot load " + path + ": " + e.what());
  }
  auto config = parseConfig(yaml);
  LOG_INFO(logger, "Loaded configuration from " << path << ", mints: " << config.mints.size());
  return config;
}

}  // namespace fedmint::client
