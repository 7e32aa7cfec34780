// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Validated parsing of host-supplied strings (command-line flags, JSON
   batch fields) into numbers, digests and byte strings

 Rules:
 - The entire input must be consumed (no trailing garbage)
 - Bounds are checked before narrowing
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/uint.hpp"

namespace spvproof {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(std::string_view str, int min, int max);

/** Parse int64_t string with bounds checking. */
std::optional<int64_t> SafeParseInt64(std::string_view str, int64_t min,
                                      int64_t max);

/** Parse uint64_t string; rejects signs and leading whitespace. */
std::optional<uint64_t> SafeParseUInt64(std::string_view str);

/** true if non-empty and every character is [0-9a-fA-F] */
bool IsValidHex(std::string_view str);

/**
 * Parse a 64-character display-order hash (as printed by Bitcoin tooling,
 * most significant byte first). An optional "0x" prefix is accepted.
 */
std::optional<uint256> SafeParseHash(std::string_view str);

/** Parse an even-length hex string into bytes, in the order written. */
std::optional<std::vector<uint8_t>> ParseHexBytes(std::string_view str);

/** Lower-case hex of a byte string. */
std::string HexStr(const std::vector<uint8_t> &bytes);

} // namespace util
} // namespace spvproof
