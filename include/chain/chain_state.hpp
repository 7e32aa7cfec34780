// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace spvproof {
namespace chain {

class ChainParams;

// Number of trailing timestamps the median-time-past rule looks at
static constexpr int MEDIAN_TIME_SPAN = 11;
static_assert(MEDIAN_TIME_SPAN % 2 == 1, "MEDIAN_TIME_SPAN must be odd for proper median calculation");

/**
 * ChainState - everything needed to validate the next header
 *
 * tipHash/height/chainWork describe the tip. The remaining fields are the
 * context the difficulty and timestamp rules read from ancestors; they are
 * supplied with the trusted checkpoint and maintained by ChainAccumulator.
 *
 * recentTimes holds up to MEDIAN_TIME_SPAN timestamps ending with the tip,
 * oldest first.
 */
struct ChainState {
  uint256 tipHash;
  int32_t height{0};
  arith_uint256 chainWork;
  uint32_t tipBits{0};
  uint32_t tipTime{0};
  // Timestamp of the first block of the current retarget period
  uint32_t periodStartTime{0};
  std::vector<uint32_t> recentTimes;

  // Median of recentTimes; tipTime when no history was supplied
  [[nodiscard]] int64_t GetMedianTimePast() const;

  // Append a timestamp, dropping the oldest beyond MEDIAN_TIME_SPAN
  void PushTime(uint32_t nTime);

  [[nodiscard]] std::string ToString() const;

  // Checkpoint at a network's genesis block
  static ChainState FromGenesis(const ChainParams &params);

  friend bool operator==(const ChainState &a, const ChainState &b) {
    return a.tipHash == b.tipHash && a.height == b.height &&
           a.chainWork == b.chainWork && a.tipBits == b.tipBits &&
           a.tipTime == b.tipTime && a.periodStartTime == b.periodStartTime &&
           a.recentTimes == b.recentTimes;
  }
  friend bool operator!=(const ChainState &a, const ChainState &b) {
    return !(a == b);
  }
};

} // namespace chain
} // namespace spvproof
