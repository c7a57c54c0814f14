// Copyright 2022 VMware, all rights reserved

#include "sliver.hpp"

#include <algorithm>
#include <cstring>

#include "assertUtils.hpp"
#include "hex_tools.h"

namespace fedmint::util {

namespace {
const std::shared_ptr<const std::string>& emptyBuffer() {
  static const auto empty = std::make_shared<const std::string>();
  return empty;
}
}  // namespace

Sliver::Sliver() : data_(emptyBuffer()), offset_(0), length_(0) {}

Sliver::Sliver(std::string&& s)
    : data_(std::make_shared<const std::string>(std::move(s))), offset_(0), length_(data_->size()) {}

Sliver::Sliver(const Sliver& base, const size_t offset, const size_t length)
    : data_(base.data_), offset_(base.offset_ + offset), length_(length) {
  FedmintAssertLE(offset, base.length_);
  FedmintAssertLE(length, base.length_ - offset);
}

Sliver Sliver::copy(const char* data, const size_t length) { return Sliver(std::string(data, length)); }

Sliver Sliver::copy(const std::vector<uint8_t>& bytes) {
  return Sliver(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

char Sliver::operator[](const size_t offset) const {
  FedmintAssertLT(offset, length_);
  return (*data_)[offset_ + offset];
}

const char* Sliver::data() const { return data_->data() + offset_; }

Sliver Sliver::subsliver(const size_t offset, const size_t length) const { return Sliver(*this, offset, length); }

bool Sliver::startsWith(const Sliver& prefix) const {
  return length_ >= prefix.length() && memcmp(data(), prefix.data(), prefix.length()) == 0;
}

bool Sliver::operator==(const Sliver& other) const {
  return length() == other.length() && memcmp(data(), other.data(), length()) == 0;
}

/**
 * Bytewise comparison. When one sliver is a prefix of the other, the shorter one sorts first.
 */
int Sliver::compare(const Sliver& other) const {
  int comp = memcmp(data(), other.data(), std::min(length(), other.length()));
  if (comp == 0) {
    if (length() < other.length()) {
      comp = -1;
    } else if (length() > other.length()) {
      comp = 1;
    }
  }
  return comp;
}

std::ostream& operator<<(std::ostream& s, const Sliver& sliver) { return hexPrint(s, sliver.data(), sliver.length()); }

}  // namespace fedmint::util
