// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <charconv>

namespace spvproof {
namespace util {

namespace {

template <typename T>
std::optional<T> ParseWhole(std::string_view str) {
  // from_chars accepts neither whitespace nor '+', but does accept '-' for
  // unsigned types by failing; either way a partial parse is an error
  if (str.empty()) {
    return std::nullopt;
  }
  T value{};
  const char *first = str.data();
  const char *last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::optional<int> SafeParseInt(std::string_view str, int min, int max) {
  auto value = ParseWhole<int64_t>(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(std::string_view str, int64_t min,
                                      int64_t max) {
  auto value = ParseWhole<int64_t>(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint64_t> SafeParseUInt64(std::string_view str) {
  return ParseWhole<uint64_t>(str);
}

bool IsValidHex(std::string_view str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<uint256> SafeParseHash(std::string_view str) {
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  auto parsed = uint256::FromHex(str);
  if (!parsed) {
    return std::nullopt;
  }
  return uint256(*parsed);
}

std::optional<std::vector<uint8_t>> ParseHexBytes(std::string_view str) {
  if (str.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    const int hi = HexValue(str[i]);
    const int lo = HexValue(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t> &bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

} // namespace util
} // namespace spvproof
