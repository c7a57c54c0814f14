// Copyright 2022 VMware, all rights reserved

/**
 * Sliver -- immutable, shared byte buffer.
 *
 * A Sliver is a view into reference-counted memory. Sub-slivers share the memory of their base and never copy it.
 * The memory is released when the last sliver referencing it goes away.
 *
 * Slivers are used for every key and value handed to the storage layer. Copying a Sliver copies the reference, not
 * the bytes.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fedmint::util {

class Sliver {
 public:
  Sliver();
  Sliver(std::string&& s);
  Sliver(const Sliver& base, const size_t offset, const size_t length);
  static Sliver copy(const char* data, const size_t length);
  static Sliver copy(const std::vector<uint8_t>& bytes);

  char operator[](const size_t offset) const;

  Sliver subsliver(const size_t offset, const size_t length) const;

  bool empty() const { return length_ == 0; }
  size_t length() const { return length_; }
  size_t size() const { return length_; }
  const char* data() const;
  const uint8_t* bytes() const { return reinterpret_cast<const uint8_t*>(data()); }
  std::string_view string_view() const { return std::string_view(data(), length_); }
  std::string toString() const { return std::string(data(), length_); }

  // True if the first `prefix.length()` bytes of this sliver equal `prefix`.
  bool startsWith(const Sliver& prefix) const;

  bool operator==(const Sliver& other) const;
  bool operator!=(const Sliver& other) const { return !(*this == other); }
  int compare(const Sliver& other) const;

 private:
  std::shared_ptr<const std::string> data_;
  size_t offset_;
  size_t length_;
};

std::ostream& operator<<(std::ostream& s, const Sliver& sliver);

inline bool operator<(const Sliver& lhs, const Sliver& rhs) { return (lhs.compare(rhs) < 0); }

}  // namespace fedmint::util

namespace std {
template <>
struct hash<fedmint::util::Sliver> {
  std::size_t operator()(fedmint::util::Sliver const& s) const noexcept {
    return std::hash<std::string_view>{}(s.string_view());
  }
};
}  // namespace std
