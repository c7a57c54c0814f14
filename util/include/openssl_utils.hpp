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
//
// Owning handles for the OpenSSL objects used by the client.

#pragma once

#include <climits>
#include <memory>

#include <openssl/evp.h>

namespace fedmint::util::openssl {

// unique_ptr deleter that calls an OpenSSL free function.
template <auto FreeFn>
struct Free {
  template <typename T>
  void operator()(T* p) const {
    FreeFn(p);
  }
};

template <typename T, auto FreeFn>
using Unique = std::unique_ptr<T, Free<FreeFn>>;

using UniqueContext = Unique<EVP_MD_CTX, EVP_MD_CTX_free>;
using UniquePKEYContext = Unique<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;
using UniquePKEY = Unique<EVP_PKEY, EVP_PKEY_free>;

constexpr int OPENSSL_SUCCESS = 1;

static_assert(CHAR_BIT == 8);

}  // namespace fedmint::util::openssl
