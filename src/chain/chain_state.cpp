// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chain_state.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include <algorithm>
#include <sstream>

namespace spvproof {
namespace chain {

int64_t ChainState::GetMedianTimePast() const {
  if (recentTimes.empty()) {
    return static_cast<int64_t>(tipTime);
  }
  std::vector<int64_t> sorted(recentTimes.begin(), recentTimes.end());
  std::sort(sorted.begin(), sorted.end());
  return sorted[sorted.size() / 2];
}

void ChainState::PushTime(uint32_t nTime) {
  recentTimes.push_back(nTime);
  if (recentTimes.size() > static_cast<size_t>(MEDIAN_TIME_SPAN)) {
    recentTimes.erase(recentTimes.begin(),
                      recentTimes.end() - MEDIAN_TIME_SPAN);
  }
}

std::string ChainState::ToString() const {
  std::stringstream s;
  s << "ChainState(tip=" << tipHash.GetHex() << ", height=" << height
    << ", work=" << chainWork.GetHex() << ", bits=0x" << std::hex << tipBits
    << std::dec << ", time=" << tipTime << ", period_start=" << periodStartTime
    << ", mtp=" << GetMedianTimePast() << ")";
  return s.str();
}

ChainState ChainState::FromGenesis(const ChainParams &params) {
  const CBlockHeader &genesis = params.GenesisBlock();
  ChainState state;
  state.tipHash = genesis.GetHash();
  state.height = 0;
  state.chainWork = consensus::GetBlockProof(genesis.nBits);
  state.tipBits = genesis.nBits;
  state.tipTime = genesis.nTime;
  state.periodStartTime = genesis.nTime;
  state.recentTimes = {genesis.nTime};
  return state;
}

} // namespace chain
} // namespace spvproof
