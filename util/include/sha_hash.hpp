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

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <openssl/evp.h>

#include "assertUtils.hpp"
#include "openssl_utils.hpp"

namespace fedmint::util {

// SHA-256 through the OpenSSL EVP interface. One instance hashes one message at a time and can be reused.
class SHA2_256 {
 public:
  static constexpr size_t SIZE_IN_BYTES = 32;
  typedef std::array<uint8_t, SIZE_IN_BYTES> Digest;

  SHA2_256() : ctx_(EVP_MD_CTX_new()) { FedmintAssert(ctx_ != nullptr); }

  Digest digest(const void* buf, size_t size) {
    init();
    update(buf, size);
    return finish();
  }

  // Hash several buffers as one message.
  void init() {
    FedmintAssert(!updating_);
    FedmintAssertEQ(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr), openssl::OPENSSL_SUCCESS);
    updating_ = true;
  }

  void update(const void* buf, size_t size) {
    FedmintAssert(updating_);
    FedmintAssertEQ(EVP_DigestUpdate(ctx_.get(), buf, size), openssl::OPENSSL_SUCCESS);
  }

  Digest finish() {
    FedmintAssert(updating_);
    Digest out;
    unsigned int len = 0;
    FedmintAssertEQ(EVP_DigestFinal_ex(ctx_.get(), out.data(), &len), openssl::OPENSSL_SUCCESS);
    FedmintAssertEQ(len, SIZE_IN_BYTES);
    updating_ = false;
    return out;
  }

 private:
  openssl::UniqueContext ctx_;
  bool updating_ = false;
};

}  // namespace fedmint::util
