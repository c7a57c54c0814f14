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

#include "mint/spend_key.h"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

#include "assertUtils.hpp"
#include "openssl_utils.hpp"

namespace fedmint::mint {

using util::openssl::OPENSSL_SUCCESS;
using util::openssl::UniqueContext;
using util::openssl::UniquePKEY;

SpendKey SpendKey::fromBytes(const std::vector<uint8_t>& bytes) {
  if (bytes.size() != KeyByteSize) {
    throw std::invalid_argument("spend key must be " + std::to_string(KeyByteSize) + " bytes, got " +
                                std::to_string(bytes.size()));
  }
  SpendKey key;
  std::copy(bytes.begin(), bytes.end(), key.bytes_.begin());
  return key;
}

SpendKey::PublicKeyBytes SpendKey::publicKey() const {
  UniquePKEY pkey{EVP_PKEY_new_raw_private_key(NID_ED25519, nullptr, bytes_.data(), bytes_.size())};
  FedmintAssert(pkey != nullptr);
  PublicKeyBytes pub;
  size_t len = pub.size();
  FedmintAssertEQ(EVP_PKEY_get_raw_public_key(pkey.get(), pub.data(), &len), OPENSSL_SUCCESS);
  FedmintAssertEQ(len, KeyByteSize);
  return pub;
}

std::vector<uint8_t> SpendKey::sign(const uint8_t* msg, size_t len) const {
  UniquePKEY pkey{EVP_PKEY_new_raw_private_key(NID_ED25519, nullptr, bytes_.data(), bytes_.size())};
  UniqueContext ctx{EVP_MD_CTX_new()};
  FedmintAssert(pkey != nullptr && ctx != nullptr);
  std::vector<uint8_t> signature(SignatureByteSize);
  size_t sigLen = signature.size();
  FedmintAssertEQ(EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()), OPENSSL_SUCCESS);
  FedmintAssertEQ(EVP_DigestSign(ctx.get(), signature.data(), &sigLen, msg, len), OPENSSL_SUCCESS);
  FedmintAssertEQ(sigLen, SignatureByteSize);
  return signature;
}

bool SpendKey::verify(const PublicKeyBytes& pub, const uint8_t* msg, size_t len, const uint8_t* sig, size_t sigLen) {
  UniquePKEY pkey{EVP_PKEY_new_raw_public_key(NID_ED25519, nullptr, pub.data(), pub.size())};
  if (!pkey) {
    return false;
  }
  UniqueContext ctx{EVP_MD_CTX_new()};
  FedmintAssert(ctx != nullptr);
  FedmintAssertEQ(EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()), OPENSSL_SUCCESS);
  return EVP_DigestVerify(ctx.get(), sig, sigLen, msg, len) == OPENSSL_SUCCESS;
}

}  // namespace fedmint::mint
