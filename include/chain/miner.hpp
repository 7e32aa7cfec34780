// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstdint>

namespace spvproof {

namespace chain {
struct ChainState;
struct ConsensusParams;
} // namespace chain

namespace mining {

/**
 * Header template extending a chain state
 *
 * Host-side tooling only (regtest batch generation, tests). The proof core
 * never mines.
 */
struct BlockTemplate {
  CBlockHeader header; // Block header to mine
  int32_t nHeight;     // Height the header will have
};

// Template on top of `tip` with the required nBits and minimum version.
// Throws std::overflow_error when the tip height cannot be incremented.
BlockTemplate CreateBlockTemplate(const chain::ChainState &tip,
                                  const chain::ConsensusParams &params,
                                  const uint256 &merkle_root, uint32_t nTime);

/**
 * Search nNonce (starting from the current value) until the header meets
 * its own target. Returns false after max_tries attempts or when the
 * nonce space is exhausted.
 */
bool MineHeader(CBlockHeader &header, const chain::ConsensusParams &params,
                uint64_t max_tries = UINT64_C(1) << 32);

} // namespace mining
} // namespace spvproof
