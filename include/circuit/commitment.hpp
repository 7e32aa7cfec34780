// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace spvproof {
namespace circuit {

// Tip reached after folding every header of the batch
struct FinalState {
  uint256 tipHash;
  int32_t height{0};
  arith_uint256 chainWork;
};

struct InclusionResult {
  uint64_t requestId{0};
  bool verified{false};

  friend bool operator==(const InclusionResult &a, const InclusionResult &b) {
    return a.requestId == b.requestId && a.verified == b.verified;
  }
};

/**
 * Commitment - the single public output of a run
 *
 * Layout of Serialize() (all integers little-endian, digests as stored):
 *
 *   tipHash            32
 *   height              4
 *   chainWork          32   (least significant byte first)
 *   finalizedHash      32
 *   blockHashesRoot    32
 *   blockHashCount      8
 *   withdrawalsRoot    32
 *   withdrawalCount     8
 *   n results          CompactSize
 *   results            n * (requestId 8, verified 1)
 */
struct Commitment {
  FinalState finalState;
  uint256 finalizedHash;
  uint256 blockHashesRoot;
  uint64_t blockHashCount{0};
  uint256 withdrawalsRoot;
  uint64_t withdrawalCount{0};
  std::vector<InclusionResult> inclusionResults;

  [[nodiscard]] std::vector<uint8_t> Serialize() const;

  // Double SHA-256 of Serialize()
  [[nodiscard]] uint256 GetHash() const;

  [[nodiscard]] std::string ToString() const;

  friend bool operator==(const Commitment &a, const Commitment &b) {
    return a.Serialize() == b.Serialize();
  }
  friend bool operator!=(const Commitment &a, const Commitment &b) {
    return !(a == b);
  }
};

} // namespace circuit
} // namespace spvproof
