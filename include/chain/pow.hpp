// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <optional>

namespace spvproof {

namespace chain {
struct ChainState;
struct ConsensusParams;
} // namespace chain

namespace consensus {

// Decode compact nBits into a target.
// std::nullopt for negative, overflowing, zero, or above-powLimit encodings.
std::optional<arith_uint256> DecodeTarget(uint32_t nBits,
                                          const chain::ConsensusParams &params);

// Work represented by a target: floor(2^256 / (target + 1)).
// Throws ArithmeticOverflow for a zero target.
arith_uint256 GetBlockProof(const arith_uint256 &target);

// Work for a compact target; 0 if nBits does not decode to a positive target
arith_uint256 GetBlockProof(uint32_t nBits);

// Bitcoin's 2016-block retarget:
//   new = old * clamp(nActualTimespan, T/4, 4T) / T, capped at powLimit
// The product is formed in 512 bits, so it never overflows or rounds early.
uint32_t CalculateNextWorkRequired(uint32_t nPrevBits, int64_t nActualTimespan,
                                   const chain::ConsensusParams &params);

// Expected nBits of the header that extends `tip`.
// Retargets only when the new height is a multiple of the adjustment
// interval; everywhere else the tip's nBits carry over.
uint32_t GetNextWorkRequired(const chain::ChainState &tip,
                             const chain::ConsensusParams &params);

// CONSENSUS-CRITICAL: hash, read as a little-endian number, must not exceed
// the target decoded from nBits. Invalid nBits never pass.
bool CheckProofOfWork(const uint256 &hash, uint32_t nBits,
                      const chain::ConsensusParams &params);

// Returns difficulty as floating point: 0x1d00ffff target / current target
double GetDifficulty(uint32_t nBits);

} // namespace consensus
} // namespace spvproof
