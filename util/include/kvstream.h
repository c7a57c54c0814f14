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

#include <sstream>
#include <string>
#include <type_traits>

#include "macros.h"
#include "type_traits.h"

// Formats `name: value` pairs to append to a log line: LOG_INFO(L, "Redeemed" << KVLOG(count, total)).
#define KVLOG(...) fedmint::util::KvLog<true> KVARGS(__VA_ARGS__)

// Values that cannot be streamed print as `_` instead of failing to compile.
#define KVLOG_FOR_ASSERT(...) fedmint::util::KvLog<false> KVARGS(__VA_ARGS__)

namespace fedmint::util {

template <bool Strict, typename K, typename V>
void KvLogOne(std::stringstream &ss, K &&key, V &&val) {
  ss << std::forward<K>(key) << ": ";
  if constexpr (!is_streamable<std::ostream, V>::value) {
    static_assert(!Strict, "Cannot log types that do not implement ostream::operator<<");
    ss << "_";
  } else if constexpr (std::is_same_v<std::decay_t<V>, bool>) {
    ss << (val ? "True" : "False");
  } else {
    ss << std::forward<V>(val);
  }
}

template <bool Strict, typename K, typename V, typename... KVPAIRS>
void KvLogPairs(std::stringstream &ss, K &&key, V &&val, KVPAIRS &&... kvpairs) {
  KvLogOne<Strict>(ss, std::forward<K>(key), std::forward<V>(val));
  if constexpr (sizeof...(kvpairs) > 0) {
    ss << ", ";
    KvLogPairs<Strict>(ss, std::forward<KVPAIRS>(kvpairs)...);
  }
}

template <bool Strict, typename... KVPAIRS>
std::string KvLog(KVPAIRS &&... kvpairs) {
  std::stringstream ss;
  ss << " ";
  KvLogPairs<Strict>(ss, std::forward<KVPAIRS>(kvpairs)...);
  return ss.str();
}

}  // namespace fedmint::util
