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

#include "mintclient/http_mint_connection.h"

#include <httplib.h>

#include "Logger.hpp"
#include "kvstream.h"
#include "mint/json_codec.h"
#include "mintclient/exception.h"

namespace fedmint::client {

namespace {

const std::string kJsonContentType = "application/json";

template <typename Duration>
std::pair<time_t, time_t> splitTimeout(Duration d) {
  const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(d).count();
  return {static_cast<time_t>(usec / 1000000), static_cast<time_t>(usec % 1000000)};
}

}  // namespace

HttpMintConnection::HttpMintConnection(std::string url,
                                       std::chrono::milliseconds connect_timeout,
                                       std::chrono::milliseconds read_timeout)
    : url_(std::move(url)), connect_timeout_(connect_timeout), read_timeout_(read_timeout) {}

void HttpMintConnection::configure(httplib::Client& cli) const {
  const auto [csec, cusec] = splitTimeout(connect_timeout_);
  const auto [rsec, rusec] = splitTimeout(read_timeout_);
  cli.set_connection_timeout(csec, cusec);
  cli.set_read_timeout(rsec, rusec);
}

void HttpMintConnection::pegIn(const mint::PegInRequest& request) {
  httplib::Client cli(url_);
  configure(cli);
  const auto body = mint::toJson(request).dump();
  auto res = cli.Put("/issuance/pegin", body, kJsonContentType.c_str());
  if (!res) {
    throw MintError(url_ + " unreachable");
  }
  if (res->status != 200) {
    throw MintError(url_ + " rejected peg-in with status " + std::to_string(res->status));
  }
  LOG_DEBUG(GATEWAY_LOG, "Peg-in accepted" << KVLOG(url_, res->status));
}

nlohmann::json HttpMintConnection::fetchIssuance(const mint::TransactionId& id) {
  httplib::Client cli(url_);
  configure(cli);
  auto res = cli.Get(("/issuance/" + id.toHex()).c_str());
  if (!res) {
    throw MintError(url_ + " unreachable");
  }
  if (res->status != 200) {
    throw MintError(url_ + " answered issuance " + id.toHex() + " with status " + std::to_string(res->status));
  }
  try {
    return nlohmann::json::parse(res->body);
  } catch (const nlohmann::json::exception& e) {
    throw MintError(url_ + " sent an undecodable body: " + e.what());
  }
}

}  // namespace fedmint::client
