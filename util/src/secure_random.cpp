// Fedmint
//
// Copyright (c) 2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#include "secure_random.hpp"

#include <climits>
#include <cstring>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "Logger.hpp"

namespace fedmint::util {

void SecureRandom::fill(std::uint8_t* out, size_t len) {
  while (len > 0) {
    const int chunk = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
    if (RAND_bytes(out, chunk) != 1) {
      const auto err = ERR_get_error();
      LOG_ERROR(GL, "RAND_bytes failed, OpenSSL error: " << err);
      throw RandomnessException("OpenSSL RAND_bytes failed with error " + std::to_string(err));
    }
    out += chunk;
    len -= static_cast<size_t>(chunk);
  }
}

SecureRandom::result_type SecureRandom::operator()() {
  std::uint8_t buf[sizeof(result_type)];
  fill(buf, sizeof(buf));
  result_type v;
  std::memcpy(&v, buf, sizeof(v));
  return v;
}

}  // namespace fedmint::util
