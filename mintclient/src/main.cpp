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

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "Logger.hpp"
#include "mintclient/config.h"
#include "mintclient/exception.h"
#include "mintclient/http_mint_connection.h"
#include "mintclient/mint_client.h"
#include "secure_random.hpp"
#include "tbs/Library.h"
#ifdef USE_ROCKSDB
#include "rocksdb/client.h"
#endif

using fedmint::client::ClientConfig;
using fedmint::client::HttpMintConnection;
using fedmint::client::IMintConnection;
using fedmint::client::MintClient;
using fedmint::mint::Amount;

namespace po = boost::program_options;

const static int kLogConfigRefreshIntervalInMs = 60 * 1000;

const static char* getLogConfigLocation() {
  auto log_location = std::getenv("FEDMINT_LOG_CONFIGURATION");
  return log_location ? log_location : "log4cplus.properties";
}

po::variables_map parseCmdLine(int argc, char** argv) {
  po::options_description desc("fedmint_client <command> [options]\n\ncommands: pegin, fetch, balance, coins, pending, spend");
  // clang-format off
  desc.add_options()
    ("help", "Print this message")
    ("config", po::value<std::string>()->required(), "YAML configuration file")
    ("command", po::value<std::string>()->required(), "Command to run")
    ("amount", po::value<uint64_t>(), "Amount in msat for pegin and spend")
  ;
  // clang-format on
  po::positional_options_description positional;
  positional.add("command", 1);

  po::variables_map opts;
  po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), opts);
  if (opts.count("help")) {
    std::cout << desc << std::endl;
    std::exit(0);
  }
  po::notify(opts);
  return opts;
}

// Pending issuances must survive the process that recorded them, so only the persistent engine is accepted.
std::shared_ptr<fedmint::storage::IDBClient> openStore(const ClientConfig& config) {
#ifdef USE_ROCKSDB
  auto db = std::make_shared<fedmint::storage::rocksdb::Client>(config.db_path);
  db->init();
  return db;
#else
  throw fedmint::client::ConfigurationException("the client was built without RocksDB and has no persistent store");
#endif
}

Amount requiredAmount(const po::variables_map& opts) {
  if (!opts.count("amount")) {
    throw fedmint::client::ConfigurationException("--amount is required for this command");
  }
  return Amount(opts["amount"].as<uint64_t>());
}

int run(const po::variables_map& opts, logging::Logger& logger) {
  const auto config = fedmint::client::loadConfig(opts["config"].as<std::string>());
  std::vector<std::shared_ptr<IMintConnection>> mints;
  for (const auto& url : config.mints) {
    mints.push_back(std::make_shared<HttpMintConnection>(url, config.connect_timeout, config.read_timeout));
  }
  MintClient client(std::move(mints), config.mint_pk, openStore(config), config.f_val);
  fedmint::util::SecureRandom rng;

  const auto command = opts["command"].as<std::string>();
  if (command == "pegin") {
    auto proof = std::make_shared<fedmint::mint::AmountPegInProof>(requiredAmount(opts));
    std::cout << client.pegIn(proof, rng) << std::endl;
  } else if (command == "fetch") {
    for (const auto& id : client.fetchAll(rng)) std::cout << id << std::endl;
  } else if (command == "balance") {
    std::cout << client.balance() << std::endl;
  } else if (command == "coins") {
    for (const auto& [amount, coin] : client.coins().flatten()) {
      std::cout << amount << " " << fedmint::client::toJson(coin).at("nonce").get<std::string>() << std::endl;
    }
  } else if (command == "pending") {
    for (const auto& id : client.pendingIssuances()) std::cout << id << std::endl;
  } else if (command == "spend") {
    const auto coins = client.selectCoins(requiredAmount(opts));
    auto notes = nlohmann::json::array();
    for (const auto& [amount, coin] : coins.flatten()) {
      auto j = fedmint::client::toJson(coin);
      j["amount"] = amount.milli_sat;
      notes.push_back(std::move(j));
    }
    client.spendCoins(coins);
    std::cout << notes.dump(2) << std::endl;
  } else {
    LOG_ERROR(logger, "Unknown command: " << command);
    return 1;
  }
  return 0;
}

int main(int argc, char** argv) {
  LOG_CONFIGURE_AND_WATCH(getLogConfigLocation(), kLogConfigRefreshIntervalInMs);
  auto logger = logging::getLogger("fedmint.client.main");
  po::variables_map opts;
  try {
    opts = parseCmdLine(argc, argv);
  } catch (const po::error& e) {
    LOG_ERROR(logger, "Failed to parse command line arguments: " << e.what());
    return 1;
  }

  try {
    // Group arithmetic stays on this thread.
    fedmint::tbs::Library::Get();
    return run(opts, logger);
  } catch (const fedmint::client::MintClientException& e) {
    LOG_ERROR(logger, e.what());
  } catch (const fedmint::storage::StorageException& e) {
    LOG_ERROR(logger, e.what());
  } catch (const std::exception& e) {
    LOG_FATAL(logger, e.what());
  }
  return 1;
}
