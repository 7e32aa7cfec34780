// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/uint.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Thrown whenever a 256-bit result cannot be represented exactly:
 * overflow on add/multiply/left-shift, subtraction below zero, division
 * by zero. Chain work and targets are never allowed to wrap.
 */
class ArithmeticOverflow : public std::overflow_error {
public:
  using std::overflow_error::overflow_error;
};

/**
 * 256-bit unsigned integer with Bitcoin's arith_uint256 interface.
 *
 * Storage is a Boost.Multiprecision checked fixed-width integer; every
 * operation that could exceed 256 bits is evaluated in 512 bits first and
 * range-checked, so results are exact or the operation throws.
 */
class arith_uint256 {
public:
  using Rep = boost::multiprecision::checked_uint256_t;
  using Wide = boost::multiprecision::uint512_t;

  arith_uint256() = default;
  arith_uint256(uint64_t b) : value_(b) {}
  explicit arith_uint256(const Rep &v) : value_(v) {}

  /** Narrow a 512-bit intermediate, throwing if it does not fit. */
  static arith_uint256 FromWide(const Wide &w);

  arith_uint256 &operator+=(const arith_uint256 &b);
  arith_uint256 &operator-=(const arith_uint256 &b);
  arith_uint256 &operator*=(const arith_uint256 &b);
  arith_uint256 &operator/=(const arith_uint256 &b);
  arith_uint256 &operator<<=(unsigned int shift);
  arith_uint256 &operator>>=(unsigned int shift);

  /** Bitwise complement within 256 bits (2^256 - 1 - x). */
  arith_uint256 operator~() const;

  friend arith_uint256 operator+(arith_uint256 a, const arith_uint256 &b) { return a += b; }
  friend arith_uint256 operator-(arith_uint256 a, const arith_uint256 &b) { return a -= b; }
  friend arith_uint256 operator*(arith_uint256 a, const arith_uint256 &b) { return a *= b; }
  friend arith_uint256 operator/(arith_uint256 a, const arith_uint256 &b) { return a /= b; }
  friend arith_uint256 operator<<(arith_uint256 a, unsigned int shift) { return a <<= shift; }
  friend arith_uint256 operator>>(arith_uint256 a, unsigned int shift) { return a >>= shift; }

  friend bool operator==(const arith_uint256 &a, const arith_uint256 &b) { return a.value_ == b.value_; }
  friend bool operator!=(const arith_uint256 &a, const arith_uint256 &b) { return a.value_ != b.value_; }
  friend bool operator<(const arith_uint256 &a, const arith_uint256 &b) { return a.value_ < b.value_; }
  friend bool operator<=(const arith_uint256 &a, const arith_uint256 &b) { return a.value_ <= b.value_; }
  friend bool operator>(const arith_uint256 &a, const arith_uint256 &b) { return a.value_ > b.value_; }
  friend bool operator>=(const arith_uint256 &a, const arith_uint256 &b) { return a.value_ >= b.value_; }

  /**
   * The "compact" format is a representation of a whole number N using an
   * unsigned 32bit number similar to a floating point format.
   * The most significant 8 bits are the unsigned exponent of base 256.
   * This exponent can be thought of as "number of bytes of N".
   * The lower 23 bits are the mantissa.
   * Bit number 24 (0x800000) represents the sign of N.
   * N = (-1^sign) * mantissa * 256^(exponent-3)
   *
   * Encodings that would not fit in 256 bits set *pfOverflow and leave the
   * value at zero.
   */
  arith_uint256 &SetCompact(uint32_t nCompact, bool *pfNegative = nullptr,
                            bool *pfOverflow = nullptr);
  uint32_t GetCompact(bool fNegative = false) const;

  /** Number of significant bits (0 for zero). */
  unsigned int bits() const;
  uint64_t GetLow64() const;
  double getdouble() const;

  std::string GetHex() const;
  std::string ToString() const { return GetHex(); }
  void SetHex(const std::string &str);

  const Rep &value() const { return value_; }

private:
  Rep value_{0};
};

/** Little-endian (least-significant byte first) conversions. */
arith_uint256 UintToArith256(const uint256 &a);
uint256 ArithToUint256(const arith_uint256 &a);

/** (base ^ exponent) mod modulus. Throws ArithmeticOverflow on zero modulus. */
arith_uint256 PowMod(const arith_uint256 &base, const arith_uint256 &exponent,
                     const arith_uint256 &modulus);
