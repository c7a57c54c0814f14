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

#include <string>

#include <nlohmann/json.hpp>

#include "mint/types.h"

namespace fedmint::client {

// One mint of the federation, as seen by the client.
class IMintConnection {
 public:
  virtual ~IMintConnection() = default;

  virtual const std::string& url() const = 0;

  // Submits a peg-in. Throws MintError unless the mint accepted it.
  virtual void pegIn(const mint::PegInRequest& request) = 0;

  // Fetches the mint's answer for an issuance as an undecoded JSON document. Throws MintError if the mint is
  // unreachable, answers with a non-success status or sends something that is not JSON. Called concurrently from
  // several threads, so implementations must not do group arithmetic here.
  virtual nlohmann::json fetchIssuance(const mint::TransactionId& id) = 0;
};

}  // namespace fedmint::client
