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

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "Relic.h"

namespace fedmint::tbs {

/**
 * Wrapper around RELIC's bn_t. (i.e., big number type)
 */
class BNT {
 public:
  bn_t n;

 public:
  BNT() {
    bn_null(n);
    bn_new(n);
    bn_zero(n);
  }

  BNT(const dig_t d) : BNT() { bn_set_dig(n, d); }

  BNT(const bn_t &o) : BNT() { bn_copy(n, o); }

  BNT(const BNT &c) : BNT() { bn_copy(n, c.n); }

  ~BNT() { bn_free(n); }

 public:
  int getBits() const { return bn_bits(n); }

  int getByteCount() const { return bn_size_bin(n); }

  bool isZero() const { return bn_is_zero(n); }

  // Writes the number big-endian, left-padded with zeros to exactly `capacity` bytes.
  void toBytes(unsigned char *buf, int capacity) const;

  void fromBytes(const unsigned char *buf, int size) { bn_read_bin(n, buf, size); }

  std::string toString(int base = 10) const;

  BNT &SlowModulo(const BNT &m) {
    bn_mod_basic(n, n, m);
    return *this;
  }

  // Returns n^{-1} mod p. The caller guarantees p is prime and 0 < n < p.
  BNT invertModPrime(const BNT &p) const;

 public:
  static BNT One() {
    static BNT one(static_cast<dig_t>(1));
    return one;
  }

 public:
  // Implicitly cast BNT objects to bn_t types so that we can keep the same syntax when calling RELIC functions
  operator bn_t &() { return n; }
  operator const bn_t &() const { return n; }

  bool operator==(const BNT &rhs) const { return bn_cmp(n, rhs.n) == CMP_EQ; }

  bool operator!=(const BNT &rhs) const { return bn_cmp(n, rhs.n) != CMP_EQ; }

  bool operator<(const BNT &rhs) const { return bn_cmp(n, rhs.n) == CMP_LT; }

  bool operator>=(const BNT &rhs) const { return bn_cmp(n, rhs.n) != CMP_LT; }

  BNT &operator=(const BNT &b) {
    bn_copy(n, b);
    return *this;
  }

  BNT operator*(const BNT &rhs) const {
    BNT mult;
    bn_mul(mult, n, rhs);
    return mult;
  }
};

/**
 * Wrapper around RELIC's g1_t. Points serialize in compressed form.
 */
class G1T {
 public:
  g1_t n;

 public:
  G1T() {
    g1_null(n);
    g1_new(n);
    g1_set_infty(n);
  }

  G1T(const G1T &c) : G1T() { g1_copy(n, c.n); }

  G1T &operator=(const G1T &c) {
    g1_copy(n, c.n);
    return *this;
  }

  ~G1T() { g1_free(n); }

 public:
  int getByteCount() const { return g1_size_bin(n, 1); }

  std::vector<uint8_t> toBytes() const;
  // Throws std::invalid_argument unless the bytes are exactly one valid compressed point.
  void fromBytes(const unsigned char *buf, int size);

  std::string toString() const;

  bool isInfinity() const { return g1_is_infty(n); }

  G1T &Times(const BNT &b) {
    g1_mul(n, n, b);
    return *this;
  }

  static G1T Times(const G1T &a, const BNT &e) {
    G1T r;
    g1_mul(r, a, e);
    return r;
  }

  // Hash-to-curve of an arbitrary byte string.
  static G1T Map(const unsigned char *buf, int len) {
    G1T r;
    g1_map(r, buf, len);
    return r;
  }

 public:
  operator g1_t &() { return n; }
  operator const g1_t &() const { return n; }

  bool operator==(const G1T &rhs) const { return g1_cmp(n, rhs.n) == CMP_EQ; }

  bool operator!=(const G1T &rhs) const { return g1_cmp(n, rhs.n) != CMP_EQ; }
};

/**
 * Wrapper around RELIC's g2_t. Points serialize in compressed form.
 */
class G2T {
 public:
  g2_t n;

 public:
  G2T() {
    g2_null(n);
    g2_new(n);
    g2_set_infty(n);
  }

  G2T(const G2T &c) : G2T() {
    // WARNING: RELIC asks for non-const, even though it does not modify the args.
    g2_copy(n, const_cast<g2_t &>(c.n));
  }

  G2T &operator=(const G2T &c) {
    g2_copy(n, const_cast<g2_t &>(c.n));
    return *this;
  }

  ~G2T() { g2_free(n); }

 public:
  int getByteCount() const { return g2_size_bin(const_cast<g2_t &>(n), 1); }

  std::vector<uint8_t> toBytes() const;
  // Throws std::invalid_argument unless the bytes are exactly one valid compressed point.
  void fromBytes(const unsigned char *buf, int size);

  std::string toString() const;

  static G2T Generator() {
    G2T r;
    g2_get_gen(r);
    return r;
  }

  static G2T Times(const G2T &a, const BNT &e) {
    G2T r;
    g2_mul(r, const_cast<G2T &>(a), e);
    return r;
  }

 public:
  operator g2_t &() { return n; }
  operator const g2_t &() const { return n; }

  bool operator==(const G2T &rhs) const {
    return g2_cmp(const_cast<g2_t &>(n), const_cast<g2_t &>(rhs.n)) == CMP_EQ;
  }

  bool operator!=(const G2T &rhs) const { return !(*this == rhs); }
};

/**
 * Wrapper around RELIC's gt_t.
 */
class GTT {
 public:
  gt_t n;

 public:
  GTT() {
    gt_null(n);
    gt_new(n);
    gt_zero(n);
  }

  GTT(const GTT &c) : GTT() { gt_copy(n, const_cast<gt_t &>(c.n)); }

  ~GTT() { gt_free(n); }

  // e(a, b)
  static GTT Pairing(const G1T &a, const G2T &b) {
    GTT r;
    pc_map(r, const_cast<G1T &>(a), const_cast<G2T &>(b));
    return r;
  }

 public:
  operator gt_t &() { return n; }
  operator const gt_t &() const { return n; }

  bool operator==(const GTT &rhs) const {
    return gt_cmp(const_cast<gt_t &>(n), const_cast<gt_t &>(rhs.n)) == CMP_EQ;
  }

  bool operator!=(const GTT &rhs) const { return !(*this == rhs); }
};

std::ostream &operator<<(std::ostream &o, const BNT &num);
std::ostream &operator<<(std::ostream &o, const G1T &num);
std::ostream &operator<<(std::ostream &o, const G2T &num);

}  // namespace fedmint::tbs
