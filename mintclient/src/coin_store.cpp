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

#include "mintclient/coin_store.h"

#include "Logger.hpp"
#include "kvstream.h"
#include "mintclient/db_keys.h"
#include "mintclient/exception.h"

namespace fedmint::client {

using storage::KeyValuePair;
using util::Sliver;

namespace {

Sliver encodeValue(const nlohmann::json& j) { return Sliver(j.dump()); }

nlohmann::json decodeValue(const Sliver& value) {
  try {
    return nlohmann::json::parse(value.string_view());
  } catch (const nlohmann::json::exception& e) {
    throw DecodingError(DecodingError::Kind::Malformed, std::string("record is not valid JSON: ") + e.what());
  }
}

PendingIssuance decodePending(const KeyValuePair& kv) {
  auto key = PendingIssuanceKey::decode(kv.first);
  return PendingIssuance{key.id, issuanceRequestFromJson(decodeValue(kv.second))};
}

OwnedCoin decodeCoin(const KeyValuePair& kv) {
  auto key = CoinKey::decode(kv.first);
  auto coin = spendableCoinFromJson(decodeValue(kv.second));
  if (coin.coin.nonce != key.nonce) {
    throw DecodingError(DecodingError::Kind::Malformed, "coin record nonce does not match its key");
  }
  return OwnedCoin{key.amount, std::move(coin)};
}

}  // namespace

CoinStore::CoinStore(std::shared_ptr<storage::IDBClient> db) : db_(std::move(db)) {}

void CoinStore::recordPending(const mint::TransactionId& id, const IssuanceRequest& request) {
  SCOPED_MDC_TX_ID(id.toHex());
  // Committed as a transaction so the record is durable before any mint sees the request.
  auto txn = db_->startTransaction();
  txn->put(PendingIssuanceKey{id}.encode(), encodeValue(toJson(request)));
  txn->commit();
  LOG_INFO(COIN_STORE_LOG, "Recorded pending issuance" << KVLOG(request.amount(), request.coins().coinCount()));
}

std::optional<IssuanceRequest> CoinStore::getPending(const mint::TransactionId& id) const {
  Sliver value;
  const auto status = db_->get(PendingIssuanceKey{id}.encode(), value);
  if (status.isNotFound()) return std::nullopt;
  if (!status.isOK()) {
    throw storage::StorageException("failed to read pending issuance " + id.toHex() + ": " + status.toString());
  }
  return issuanceRequestFromJson(decodeValue(value));
}

void CoinStore::commitRedeemed(const RedeemBatch& batch) {
  auto txn = db_->startTransaction();
  for (const auto& [amount, coin] : batch.coins.flatten()) {
    txn->put(CoinKey{amount, coin.coin.nonce}.encode(), encodeValue(toJson(coin)));
  }
  for (const auto& id : batch.issuances) {
    txn->del(PendingIssuanceKey{id}.encode());
  }
  txn->commit();
  LOG_INFO(COIN_STORE_LOG,
           "Committed redeemed issuances" << KVLOG(batch.issuances.size(), batch.coins.coinCount(),
                                                   batch.coins.totalAmount()));
}

RecordRange<PendingIssuance> CoinStore::listPending() const {
  return RecordRange<PendingIssuance>(storage::PrefixRange(*db_, PendingIssuanceKey::prefix()), decodePending);
}

RecordRange<OwnedCoin> CoinStore::listOwnedCoins() const {
  return RecordRange<OwnedCoin>(storage::PrefixRange(*db_, CoinKey::prefix()), decodeCoin);
}

void CoinStore::spend(const mint::Coins<SpendableCoin>& coins) {
  auto txn = db_->startTransaction();
  for (const auto& [amount, coin] : coins.flatten()) {
    txn->del(CoinKey{amount, coin.coin.nonce}.encode());
  }
  txn->commit();
  LOG_INFO(COIN_STORE_LOG, "Spent coins" << KVLOG(coins.coinCount(), coins.totalAmount()));
}

}  // namespace fedmint::client
