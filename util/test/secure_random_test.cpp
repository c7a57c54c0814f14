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

#include "gtest/gtest.h"

#include <algorithm>
#include <numeric>
#include <random>
#include <set>
#include <vector>

#include "secure_random.hpp"

namespace {

using fedmint::util::SecureRandom;

TEST(secure_random, bytes_differ_between_draws) {
  SecureRandom rng;
  auto a = rng.bytes(32);
  auto b = rng.bytes(32);
  ASSERT_EQ(32u, a.size());
  ASSERT_NE(a, b);
}

TEST(secure_random, usable_with_standard_algorithms) {
  SecureRandom rng;
  std::vector<int> v(16);
  std::iota(v.begin(), v.end(), 0);
  auto shuffled = v;
  std::shuffle(shuffled.begin(), shuffled.end(), rng);
  ASSERT_TRUE(std::is_permutation(v.begin(), v.end(), shuffled.begin()));

  std::uniform_int_distribution<size_t> pick(0, 4);
  std::set<size_t> seen;
  for (int i = 0; i < 200; ++i) {
    seen.insert(pick(rng));
  }
  ASSERT_EQ(5u, seen.size());
}

TEST(secure_random, only_secure_random_is_a_crypto_rng) {
  static_assert(fedmint::util::is_crypto_rng_v<SecureRandom>);
  static_assert(!fedmint::util::is_crypto_rng_v<std::mt19937_64>);
  static_assert(!fedmint::util::is_crypto_rng_v<std::minstd_rand>);
  ASSERT_TRUE(fedmint::util::is_crypto_rng<SecureRandom>::value);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
