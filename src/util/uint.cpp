// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2020 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/uint.hpp"

#include <iomanip>
#include <sstream>

// Helper function to convert hex character to value
static inline int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

static std::string_view StripHexPrefix(std::string_view str) {
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  return str;
}

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  // Reverse byte order for display (little-endian to big-endian)
  for (int i = WIDTH - 1; i >= 0; --i) {
    ss << std::setw(2) << static_cast<unsigned int>(m_data[i]);
  }
  return ss.str();
}

template <unsigned int BITS> std::string base_blob<BITS>::GetRawHex() const {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (int i = 0; i < WIDTH; ++i) {
    ss << std::setw(2) << static_cast<unsigned int>(m_data[i]);
  }
  return ss.str();
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();
  str = StripHexPrefix(str);

  // Only the leading run of hex digits is significant
  size_t digits = 0;
  while (digits < str.size() && HexDigit(str[digits]) != -1) {
    digits++;
  }

  // Consume digits from the least significant end (last in the string)
  unsigned char *p1 = begin();
  unsigned char *pend = end();
  size_t pos = digits;
  while (pos > 0 && p1 < pend) {
    *p1 = static_cast<unsigned char>(HexDigit(str[--pos]));
    if (pos > 0) {
      *p1 |= static_cast<unsigned char>(HexDigit(str[--pos]) << 4);
    }
    p1++;
  }
}

template <unsigned int BITS> void base_blob<BITS>::SetHex(const char *psz) {
  SetHex(std::string_view(psz));
}

template <unsigned int BITS>
std::optional<base_blob<BITS>>
base_blob<BITS>::FromHex(std::string_view str) {
  auto raw = FromRawHex(str);
  if (!raw) {
    return std::nullopt;
  }
  std::reverse(raw->m_data.begin(), raw->m_data.end());
  return raw;
}

template <unsigned int BITS>
std::optional<base_blob<BITS>>
base_blob<BITS>::FromRawHex(std::string_view str) {
  if (str.size() != static_cast<size_t>(WIDTH) * 2) {
    return std::nullopt;
  }
  base_blob<BITS> out;
  for (int i = 0; i < WIDTH; ++i) {
    const int hi = HexDigit(str[2 * i]);
    const int lo = HexDigit(str[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.m_data[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return out;
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

// Explicit instantiations for base_blob<256>
template class base_blob<256>;

// Static constants
const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
