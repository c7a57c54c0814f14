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

#include "endianness.hpp"
#include "hex_tools.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace fedmint::util;

TEST(hex_tools, unhex_empty) { ASSERT_TRUE(unhex("").empty()); }

TEST(hex_tools, unhex_lower_0x_empty) { ASSERT_TRUE(unhex("0x").empty()); }

TEST(hex_tools, unhex_odd_size) { ASSERT_THROW(unhex("123"), std::invalid_argument); }

TEST(hex_tools, unhex_invalid_char_with_0x) { ASSERT_THROW(unhex("0x12ck"), std::invalid_argument); }

TEST(hex_tools, unhex_invalid_char_without_0x) { ASSERT_THROW(unhex("12ck"), std::invalid_argument); }

TEST(hex_tools, unhex_0x_in_the_middle) { ASSERT_THROW(unhex("126a0x"), std::invalid_argument); }

TEST(hex_tools, unhex_mixed_case) {
  const auto bytes = unhex("0X61646A");
  ASSERT_EQ((std::vector<uint8_t>{'a', 'd', 'j'}), bytes);
  ASSERT_EQ(bytes, unhex("61646a"));
}

TEST(hex_tools, buffer_to_hex_is_lowercase_without_prefix) {
  const std::vector<uint8_t> bytes{0x00, 0x0f, 0xab, 0xff};
  ASSERT_EQ("000fabff", vectorToHex(bytes));
  ASSERT_EQ(bytes, unhex(vectorToHex(bytes)));
}

TEST(endianness, big_endian_u64) {
  const auto buf = toBigEndianArrayBuffer<uint64_t>(0x0102030405060708ULL);
  ASSERT_EQ((std::array<uint8_t, 8>{1, 2, 3, 4, 5, 6, 7, 8}), buf);
  ASSERT_EQ(0x0102030405060708ULL, fromBigEndianBuffer<uint64_t>(buf.data()));
  ASSERT_EQ(std::string("\x00\x00\x00\x2a", 4), toBigEndianStringBuffer<uint32_t>(42));
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
