// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chain_state.hpp"
#include "chain/validation.hpp"
#include <cstdint>
#include <optional>

class CBlockHeader;

namespace spvproof {
namespace chain {

struct ConsensusParams;

/**
 * ChainAccumulator - folds headers onto a trusted checkpoint
 *
 * Single linear chain, no forks: each header must extend the current tip.
 * A rejected header leaves the state exactly as it was; the caller decides
 * whether to abort (the circuit always does).
 *
 * The accumulator owns its ChainState. The consensus params must outlive it.
 */
class ChainAccumulator {
public:
  ChainAccumulator(ChainState checkpoint, const ConsensusParams &params);

  /**
   * Validate `header` against the tip and, if it passes, make it the new
   * tip. On success `out` receives the header hash and target.
   *
   * Failure classes: every header check, DIFFICULTY_MISMATCH, and
   * ARITHMETIC_OVERFLOW (reported through state.Error()) when height or
   * cumulative work would no longer fit.
   */
  bool Apply(const CBlockHeader &header, validation::ValidationState &state,
             validation::CheckedHeader &out,
             std::optional<int64_t> adjusted_time = std::nullopt);

  bool Apply(const CBlockHeader &header, validation::ValidationState &state) {
    validation::CheckedHeader out;
    return Apply(header, state, out);
  }

  [[nodiscard]] const ChainState &GetState() const { return state_; }
  [[nodiscard]] const ConsensusParams &GetParams() const { return params_; }

private:
  ChainState state_;
  const ConsensusParams &params_;
};

} // namespace chain
} // namespace spvproof
