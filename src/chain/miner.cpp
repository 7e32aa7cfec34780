// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/miner.hpp"
#include "chain/chain_state.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include <limits>
#include <stdexcept>

namespace spvproof {
namespace mining {

BlockTemplate CreateBlockTemplate(const chain::ChainState &tip,
                                  const chain::ConsensusParams &params,
                                  const uint256 &merkle_root, uint32_t nTime) {
  if (tip.height == std::numeric_limits<int32_t>::max()) {
    throw std::overflow_error("CreateBlockTemplate: tip height at maximum");
  }
  BlockTemplate tmpl;
  tmpl.nHeight = tip.height + 1;

  tmpl.header.nVersion = 1;
  if (tmpl.nHeight >= params.BIP65Height) {
    tmpl.header.nVersion = 4;
  } else if (tmpl.nHeight >= params.BIP66Height) {
    tmpl.header.nVersion = 3;
  } else if (tmpl.nHeight >= params.BIP34Height) {
    tmpl.header.nVersion = 2;
  }
  tmpl.header.hashPrevBlock = tip.tipHash;
  tmpl.header.hashMerkleRoot = merkle_root;
  tmpl.header.nTime = nTime;
  tmpl.header.nBits = consensus::GetNextWorkRequired(tip, params);
  tmpl.header.nNonce = 0;
  return tmpl;
}

bool MineHeader(CBlockHeader &header, const chain::ConsensusParams &params,
                uint64_t max_tries) {
  for (uint64_t tries = 0; tries < max_tries; ++tries) {
    if (consensus::CheckProofOfWork(header.GetHash(), header.nBits, params)) {
      LOG_CHAIN_TRACE("Mined header {} after {} tries", header.GetHash().GetHex(),
                      tries + 1);
      return true;
    }
    if (header.nNonce == std::numeric_limits<uint32_t>::max()) {
      break;
    }
    ++header.nNonce;
  }
  return false;
}

} // namespace mining
} // namespace spvproof
