// Copyright 2022 VMware, all rights reserved

#include "hex_tools.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fedmint::util {

std::ostream &hexPrint(std::ostream &s, const char *data, size_t size) {
  std::ios::fmtflags f(s.flags());
  for (size_t i = 0; i < size; i++) {
    // Go through uint8_t so that negative chars do not sign-extend.
    const auto u = static_cast<std::uint8_t>(data[i]);
    s << std::hex << std::setw(2) << std::setfill('0') << static_cast<std::uint16_t>(u);
  }
  s.flags(f);
  return s;
}

std::string bufferToHex(const char *data, const size_t size) {
  auto ss = std::stringstream{};
  hexPrint(ss, data, size);
  return ss.str();
}

std::string bufferToHex(const std::uint8_t *data, size_t size) {
  return bufferToHex(reinterpret_cast<const char *>(data), size);
}

std::string vectorToHex(const std::vector<std::uint8_t> &data) { return bufferToHex(data.data(), data.size()); }

std::vector<uint8_t> unhex(const std::string &hex) {
  const auto inputLen = hex.size();
  if (inputLen % 2) {
    throw std::invalid_argument{"Invalid hex string: " + hex};
  }

  const auto valid_chars = "0123456789abcdefABCDEF";
  auto start = std::string::size_type{0};
  if (hex.rfind("0x", 0) == 0 || hex.rfind("0X", 0) == 0) {
    start += 2;
  }
  if (hex.find_first_not_of(valid_chars, start) != std::string::npos) {
    throw std::invalid_argument{"Invalid hex string: " + hex};
  }

  std::vector<uint8_t> output;
  output.reserve((inputLen - start) / 2);
  for (size_t i = start; i < inputLen; i += 2) {
    output.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
  }
  return output;
}

}  // namespace fedmint::util
