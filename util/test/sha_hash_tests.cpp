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

#include <vector>

#include "hex_tools.h"
#include "sha_hash.hpp"

using namespace fedmint::util;

namespace {

std::string digestHex(const SHA2_256::Digest& d) { return bufferToHex(d.data(), d.size()); }

TEST(sha2_256, known_digests) {
  auto sha = SHA2_256{};
  ASSERT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", digestHex(sha.digest("", 0)));
  // The context is reusable.
  ASSERT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", digestHex(sha.digest("", 0)));
  ASSERT_EQ("70b1e8e06785cae451496104850781f33faf6cc8e0777ecd3a9ccaaefb154b2d", digestHex(sha.digest("artist", 6)));
  ASSERT_EQ("ca1a9546e25a6074e7ae971701beeeb10ab85920792bd2031fb995832baf8833", digestHex(sha.digest("REM", 3)));
}

TEST(sha2_256, piecewise_equals_whole) {
  auto sha = SHA2_256{};
  const auto whole = sha.digest("artistREM", 9);

  sha.init();
  sha.update("art", 3);
  sha.update("ist", 3);
  sha.update("REM", 3);
  ASSERT_EQ(whole, sha.finish());
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
