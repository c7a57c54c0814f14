// Fedmint
//
// Copyright (c) 2018-2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#include "tbs/RelicTypes.h"
#include "tbs/Library.h"

#include <cstring>
#include <stdexcept>
#include <vector>

#include "Logger.hpp"
#include "assertUtils.hpp"
#include "hex_tools.h"

namespace fedmint::tbs {

namespace {

// RELIC reports bad input through its error state rather than a return code. Reading clears it.
bool relicErrorRaised() { return err_get_code() != STS_OK; }

}  // namespace

/**
 * BNT
 */

void BNT::toBytes(unsigned char* buf, int capacity) const {
  int size = getByteCount();
  if (capacity < size) {
    LOG_ERROR(TBS_LOG,
              "Expected buffer of size " << size << " bytes for serializing BNT object. You provided " << capacity
                                         << " bytes");
    throw std::logic_error("Buffer not large enough for serializing BNT");
  }
  memset(buf, 0, static_cast<size_t>(capacity));
  bn_write_bin(buf, capacity, n);
}

std::string BNT::toString(int base) const {
  int size = bn_size_str(n, base);
  std::vector<char> buf(static_cast<size_t>(size));
  bn_write_str(buf.data(), size, n, base);
  return std::string(buf.data());
}

BNT BNT::invertModPrime(const BNT& p) const {
  BNT gcd, inv;
  bn_gcd_ext_lehme(gcd, inv, nullptr, n, p);
  FedmintAssertEQ(((*this) * inv).SlowModulo(p), BNT::One());
  if (inv >= p || bn_sign(inv.n) == BN_NEG) {
    inv.SlowModulo(p);
  }
  return inv;
}

/**
 * G1T
 */

std::vector<uint8_t> G1T::toBytes() const {
  std::vector<uint8_t> buf(static_cast<size_t>(getByteCount()));
  g1_write_bin(buf.data(), static_cast<int>(buf.size()), n, 1);
  return buf;
}

void G1T::fromBytes(const unsigned char* buf, int size) {
  if (size != Library::Get().getG1PointSize()) {
    throw std::invalid_argument("G1 point must be " + std::to_string(Library::Get().getG1PointSize()) +
                                " bytes, got " + std::to_string(size));
  }
  relicErrorRaised();
  g1_read_bin(n, buf, size);
  if (relicErrorRaised() || !g1_is_valid(n)) {
    throw std::invalid_argument("Bytes do not encode a G1 point");
  }
}

std::string G1T::toString() const {
  const auto bytes = toBytes();
  return util::vectorToHex(bytes);
}

/**
 * G2T
 */

std::vector<uint8_t> G2T::toBytes() const {
  std::vector<uint8_t> buf(static_cast<size_t>(getByteCount()));
  // FIXME: RELIC: g2_write_bin should take const g2_t
  g2_write_bin(buf.data(), static_cast<int>(buf.size()), const_cast<g2_t&>(n), 1);
  return buf;
}

void G2T::fromBytes(const unsigned char* buf, int size) {
  if (size != Library::Get().getG2PointSize()) {
    throw std::invalid_argument("G2 point must be " + std::to_string(Library::Get().getG2PointSize()) +
                                " bytes, got " + std::to_string(size));
  }
  relicErrorRaised();
  g2_read_bin(n, const_cast<unsigned char*>(buf), size);
  if (relicErrorRaised() || !g2_is_valid(n)) {
    throw std::invalid_argument("Bytes do not encode a G2 point");
  }
}

std::string G2T::toString() const {
  const auto bytes = toBytes();
  return util::vectorToHex(bytes);
}

std::ostream& operator<<(std::ostream& o, const BNT& num) { return o << num.toString(); }

std::ostream& operator<<(std::ostream& o, const G1T& num) { return o << num.toString(); }

std::ostream& operator<<(std::ostream& o, const G2T& num) { return o << num.toString(); }

}  // namespace fedmint::tbs
