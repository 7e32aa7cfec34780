// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/pow.hpp"
#include "chain/chain_state.hpp"
#include "chain/chainparams.hpp"
#include "util/logging.hpp"

namespace spvproof {
namespace consensus {

std::optional<arith_uint256> DecodeTarget(uint32_t nBits,
                                          const chain::ConsensusParams &params) {
  bool fNegative;
  bool fOverflow;
  arith_uint256 bnTarget;
  bnTarget.SetCompact(nBits, &fNegative, &fOverflow);

  if (fNegative || fOverflow || bnTarget == 0 ||
      bnTarget > UintToArith256(params.powLimit)) {
    LOG_CHAIN_TRACE("DecodeTarget: bits={:#010x} rejected (negative={} "
                    "overflow={} zero={})",
                    nBits, fNegative, fOverflow, bnTarget == 0);
    return std::nullopt;
  }
  return bnTarget;
}

arith_uint256 GetBlockProof(const arith_uint256 &target) {
  // We need to compute 2**256 / (bnTarget+1), but we can't represent 2**256
  // as it's too large for an arith_uint256. However, as 2**256 is at least as
  // large as bnTarget+1, it is equal to ((2**256 - bnTarget - 1) /
  // (bnTarget+1)) + 1, or ~bnTarget / (bnTarget+1) + 1.
  return (~target / (target + 1)) + 1;
}

arith_uint256 GetBlockProof(uint32_t nBits) {
  arith_uint256 bnTarget;
  bool fNegative;
  bool fOverflow;
  bnTarget.SetCompact(nBits, &fNegative, &fOverflow);
  if (fNegative || fOverflow || bnTarget == 0) {
    return arith_uint256(0);
  }
  return GetBlockProof(bnTarget);
}

uint32_t CalculateNextWorkRequired(uint32_t nPrevBits, int64_t nActualTimespan,
                                   const chain::ConsensusParams &params) {
  if (params.fPowNoRetargeting) {
    return nPrevBits;
  }

  // Limit adjustment step
  const int64_t nTargetTimespan = params.nPowTargetTimespan;
  if (nActualTimespan < nTargetTimespan / 4) {
    nActualTimespan = nTargetTimespan / 4;
  }
  if (nActualTimespan > nTargetTimespan * 4) {
    nActualTimespan = nTargetTimespan * 4;
  }

  const arith_uint256 bnPowLimit = UintToArith256(params.powLimit);
  arith_uint256 bnOld;
  bnOld.SetCompact(nPrevBits);

  arith_uint256::Wide bnNew(bnOld.value());
  bnNew *= static_cast<uint64_t>(nActualTimespan);
  bnNew /= static_cast<uint64_t>(nTargetTimespan);

  arith_uint256 result = bnPowLimit;
  if (bnNew < arith_uint256::Wide(bnPowLimit.value())) {
    result = arith_uint256::FromWide(bnNew);
  }

  LOG_CHAIN_TRACE("CalculateNextWorkRequired: prev_bits={:#010x} timespan={}s "
                  "-> bits={:#010x}",
                  nPrevBits, nActualTimespan, result.GetCompact());
  return result.GetCompact();
}

uint32_t GetNextWorkRequired(const chain::ChainState &tip,
                             const chain::ConsensusParams &params) {
  const int64_t interval = params.DifficultyAdjustmentInterval();

  // Only change once per difficulty adjustment interval
  if ((static_cast<int64_t>(tip.height) + 1) % interval != 0) {
    return tip.tipBits;
  }

  const int64_t nActualTimespan = static_cast<int64_t>(tip.tipTime) -
                                  static_cast<int64_t>(tip.periodStartTime);
  LOG_CHAIN_DEBUG("Retarget at height {}: period {}..{} ({}s)",
                  tip.height + 1, tip.periodStartTime, tip.tipTime,
                  nActualTimespan);
  return CalculateNextWorkRequired(tip.tipBits, nActualTimespan, params);
}

bool CheckProofOfWork(const uint256 &hash, uint32_t nBits,
                      const chain::ConsensusParams &params) {
  auto bnTarget = DecodeTarget(nBits, params);
  if (!bnTarget) {
    return false;
  }

  // Check proof of work matches claimed amount
  if (UintToArith256(hash) > *bnTarget) {
    LOG_CHAIN_TRACE("CheckProofOfWork: hash {} above target {}",
                    hash.GetHex(), bnTarget->GetHex());
    return false;
  }
  return true;
}

double GetDifficulty(uint32_t nBits) {
  int nShift = (nBits >> 24) & 0xff;
  const uint32_t mantissa = nBits & 0x00ffffff;
  if (mantissa == 0) {
    return 0.0;
  }
  double dDiff = (double)0x0000ffff / (double)mantissa;

  while (nShift < 29) {
    dDiff *= 256.0;
    nShift++;
  }
  while (nShift > 29) {
    dDiff /= 256.0;
    nShift--;
  }

  return dDiff;
}

} // namespace consensus
} // namespace spvproof
