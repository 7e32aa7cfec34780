// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "chain/endian.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/** Template base class for fixed-sized opaque blobs. */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0,
                "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;
  static_assert(WIDTH == sizeof(m_data), "Sanity check");

public:
  /* construct 0 value by default */
  constexpr base_blob() : m_data() {}

  /* constructor for constants between 1 and 255 */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  constexpr explicit base_blob(std::span<const unsigned char> vch) {
    assert(vch.size() == WIDTH);
    std::copy(vch.begin(), vch.end(), m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  /** Lexicographic ordering
   * @note Does NOT match the numeric ordering of arith_uint256, which
   *       starts comparing from the most significant (last) byte.
   */
  constexpr int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend constexpr bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend constexpr bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend constexpr bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  /** @name Hex representation
   *
   * GetHex()/SetHex() show the bytes in reverse order, which is how block
   * hashes, txids and merkle roots are displayed by Bitcoin tooling. A blob
   * holding a little-endian number therefore prints as that number in
   * ordinary base-16.
   *
   * GetRawHex()/SetRawHex() use storage order, matching the bytes on the
   * wire (e.g. a serialized 80-byte header).
   *
   * @{*/
  std::string GetHex() const;
  std::string ToString() const;
  std::string GetRawHex() const;

  /** Set from display hex. Supports optional "0x" prefix. */
  void SetHex(const char *psz);
  void SetHex(std::string_view str);

  /** Strict parse of exactly WIDTH*2 display-order hex digits. */
  static std::optional<base_blob> FromHex(std::string_view str);
  /** Strict parse of exactly WIDTH*2 storage-order hex digits. */
  static std::optional<base_blob> FromRawHex(std::string_view str);
  /**@}*/

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

  constexpr uint64_t GetUint64(int pos) const {
    return endian::ReadLE64(m_data.data() + pos * 8);
  }
};

/** 256-bit opaque blob.
 * @note This type is called uint256 for historical reasons only. It is an
 * opaque blob of 256 bits and has no integer operations. Use arith_uint256 if
 * those are required.
 */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  constexpr explicit uint256(std::span<const unsigned char> vch)
      : base_blob<256>(vch) {}
  constexpr uint256(const base_blob<256> &b) : base_blob<256>(b) {}

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* uint256 from const char *.
 * This is a separate function because the constructor uint256(const char*) can
 * result in dangerously catching uint256(0).
 */
inline uint256 uint256S(const char *str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}
