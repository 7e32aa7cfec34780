// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/arith_uint256.hpp"
#include <limits>

namespace {

using Wide = arith_uint256::Wide;

const Wide &Limit() {
  static const Wide limit = Wide(1) << 256;
  return limit;
}

Wide Widen(const arith_uint256 &a) { return Wide(a.value()); }

} // namespace

arith_uint256 arith_uint256::FromWide(const Wide &w) {
  if (w >= Limit()) {
    throw ArithmeticOverflow("arith_uint256: value exceeds 256 bits");
  }
  return arith_uint256(static_cast<Rep>(w));
}

arith_uint256 &arith_uint256::operator+=(const arith_uint256 &b) {
  *this = FromWide(Widen(*this) + Widen(b));
  return *this;
}

arith_uint256 &arith_uint256::operator-=(const arith_uint256 &b) {
  if (b.value_ > value_) {
    throw ArithmeticOverflow("arith_uint256: subtraction underflow");
  }
  value_ -= b.value_;
  return *this;
}

arith_uint256 &arith_uint256::operator*=(const arith_uint256 &b) {
  *this = FromWide(Widen(*this) * Widen(b));
  return *this;
}

arith_uint256 &arith_uint256::operator/=(const arith_uint256 &b) {
  if (b.value_ == 0) {
    throw ArithmeticOverflow("arith_uint256: division by zero");
  }
  value_ /= b.value_;
  return *this;
}

arith_uint256 &arith_uint256::operator<<=(unsigned int shift) {
  if (value_ == 0 || shift == 0) {
    return *this;
  }
  if (bits() + shift > 256) {
    throw ArithmeticOverflow("arith_uint256: left shift overflow");
  }
  *this = FromWide(Widen(*this) << shift);
  return *this;
}

arith_uint256 &arith_uint256::operator>>=(unsigned int shift) {
  if (shift >= 256) {
    value_ = 0;
  } else {
    value_ >>= shift;
  }
  return *this;
}

arith_uint256 arith_uint256::operator~() const {
  return FromWide(Limit() - 1 - Widen(*this));
}

arith_uint256 &arith_uint256::SetCompact(uint32_t nCompact, bool *pfNegative,
                                         bool *pfOverflow) {
  const int nSize = static_cast<int>(nCompact >> 24);
  uint32_t nWord = nCompact & 0x007fffff;
  if (nSize <= 3) {
    nWord >>= 8 * (3 - nSize);
  }

  const bool negative = nWord != 0 && (nCompact & 0x00800000) != 0;
  const bool overflow = nWord != 0 && ((nSize > 34) ||
                                       (nWord > 0xff && nSize > 33) ||
                                       (nWord > 0xffff && nSize > 32));
  if (pfNegative) {
    *pfNegative = negative;
  }
  if (pfOverflow) {
    *pfOverflow = overflow;
  }

  if (overflow) {
    value_ = 0;
    return *this;
  }

  value_ = nWord;
  if (nSize > 3) {
    *this <<= static_cast<unsigned int>(8 * (nSize - 3));
  }
  return *this;
}

uint32_t arith_uint256::GetCompact(bool fNegative) const {
  int nSize = static_cast<int>((bits() + 7) / 8);
  uint32_t nCompact = 0;
  if (nSize <= 3) {
    nCompact = static_cast<uint32_t>(GetLow64() << (8 * (3 - nSize)));
  } else {
    arith_uint256 bn = *this >> static_cast<unsigned int>(8 * (nSize - 3));
    nCompact = static_cast<uint32_t>(bn.GetLow64());
  }
  // The 0x00800000 bit denotes the sign.
  // Thus, if it is already set, divide the mantissa by 256 and increase the
  // exponent.
  if (nCompact & 0x00800000) {
    nCompact >>= 8;
    nSize++;
  }
  nCompact |= static_cast<uint32_t>(nSize) << 24;
  nCompact |= (fNegative && (nCompact & 0x007fffff) ? 0x00800000 : 0);
  return nCompact;
}

unsigned int arith_uint256::bits() const {
  if (value_ == 0) {
    return 0;
  }
  return boost::multiprecision::msb(value_) + 1;
}

uint64_t arith_uint256::GetLow64() const {
  const Rep mask(std::numeric_limits<uint64_t>::max());
  return static_cast<uint64_t>(value_ & mask);
}

double arith_uint256::getdouble() const {
  return value_.convert_to<double>();
}

std::string arith_uint256::GetHex() const {
  return ArithToUint256(*this).GetHex();
}

void arith_uint256::SetHex(const std::string &str) {
  *this = UintToArith256(uint256S(str));
}

arith_uint256 UintToArith256(const uint256 &a) {
  arith_uint256::Rep v = 0;
  for (int i = static_cast<int>(a.size()) - 1; i >= 0; --i) {
    v <<= 8;
    v |= a.data()[i];
  }
  return arith_uint256(v);
}

uint256 ArithToUint256(const arith_uint256 &a) {
  uint256 out;
  arith_uint256::Rep v = a.value();
  for (unsigned int i = 0; i < out.size(); ++i) {
    out.data()[i] = static_cast<uint8_t>(static_cast<unsigned int>(v & 0xff));
    v >>= 8;
  }
  return out;
}

arith_uint256 PowMod(const arith_uint256 &base, const arith_uint256 &exponent,
                     const arith_uint256 &modulus) {
  if (modulus == 0) {
    throw ArithmeticOverflow("PowMod: zero modulus");
  }
  // Operands stay below 2^256, so every intermediate product fits in 512 bits
  const Wide result = boost::multiprecision::powm(Widen(base), Widen(exponent),
                                                  Widen(modulus));
  return arith_uint256::FromWide(result);
}
