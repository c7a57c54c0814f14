// Copyright 2022 VMware, all rights reserved

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace fedmint::util {

// Print <size> bytes from <data> to <s> as lowercase hex, without a prefix.
std::ostream &hexPrint(std::ostream &s, const char *data, size_t size);

// Converts a buffer into a lowercase hex string.
std::string bufferToHex(const char *data, size_t size);
std::string bufferToHex(const std::uint8_t *data, size_t size);

// Converts a byte vector into a lowercase hex string.
std::string vectorToHex(const std::vector<std::uint8_t> &data);

// Converts a hex string (upper or lower case, optional leading 0x) into bytes.
// Throws std::invalid_argument on an odd length or a non-hex character.
std::vector<std::uint8_t> unhex(const std::string &hex);

}  // namespace fedmint::util
