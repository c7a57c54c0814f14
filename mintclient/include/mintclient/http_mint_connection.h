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
#include <string>

#include "mintclient/mint_connection.h"

namespace httplib {
class Client;
}

namespace fedmint::client {

// Talks to a mint over its HTTP API:
//
//   PUT /issuance/pegin      body: PegInRequest JSON, 200 on acceptance
//   GET /issuance/<id hex>   200 with a SigResponse JSON once the signatures are ready
//
// Every call opens its own connection, so one instance can serve concurrent fetches.
class HttpMintConnection : public IMintConnection {
 public:
  HttpMintConnection(std::string url, std::chrono::milliseconds connect_timeout, std::chrono::milliseconds read_timeout);

  const std::string& url() const override { return url_; }
  void pegIn(const mint::PegInRequest& request) override;
  nlohmann::json fetchIssuance(const mint::TransactionId& id) override;

 private:
  void configure(httplib::Client& cli) const;

  std::string url_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds read_timeout_;
};

}  // namespace fedmint::client
