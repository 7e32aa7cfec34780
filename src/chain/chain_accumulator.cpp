// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chain_accumulator.hpp"
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include <limits>
#include <stdexcept>
#include <utility>

namespace spvproof {
namespace chain {

using validation::ValidationError;

ChainAccumulator::ChainAccumulator(ChainState checkpoint,
                                   const ConsensusParams &params)
    : state_(std::move(checkpoint)), params_(params) {}

bool ChainAccumulator::Apply(const CBlockHeader &header,
                             validation::ValidationState &state,
                             validation::CheckedHeader &out,
                             std::optional<int64_t> adjusted_time) {
  const validation::HeaderContext ctx{state_, params_, adjusted_time};
  if (!validation::CheckBlockHeader(header, ctx, out, state)) {
    return false;
  }
  if (!validation::ContextualCheckBlockHeader(header, state_, params_, state)) {
    LOG_CHAIN_DEBUG("Header {} rejected: {}", out.hash.GetHex(),
                    state.ToString());
    return false;
  }

  if (state_.height == std::numeric_limits<int32_t>::max()) {
    return state.Error(ValidationError::ARITHMETIC_OVERFLOW, "height-overflow",
                       "chain height cannot be incremented");
  }

  // Build the successor on a copy so a throw leaves state_ untouched
  ChainState next = state_;
  try {
    next.chainWork += consensus::GetBlockProof(out.target);
  } catch (const std::overflow_error &e) {
    return state.Error(ValidationError::ARITHMETIC_OVERFLOW, "work-overflow",
                       e.what());
  }

  next.tipHash = out.hash;
  next.height = state_.height + 1;
  next.tipBits = header.nBits;
  next.tipTime = header.nTime;
  next.PushTime(header.nTime);
  if (next.height % params_.DifficultyAdjustmentInterval() == 0) {
    next.periodStartTime = header.nTime;
  }

  LOG_CHAIN_TRACE("Accepted header {} at height {} (work={})",
                  next.tipHash.GetHex(), next.height, next.chainWork.GetHex());
  state_ = std::move(next);
  return true;
}

} // namespace chain
} // namespace spvproof
