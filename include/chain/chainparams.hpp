// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spvproof {
namespace chain {

/**
 * Chain type enumeration
 * Simple modern enum class (vs Bitcoins's ChainType)
 */
enum class ChainType {
  MAIN,   // Bitcoin mainnet
  SIGNET, // Default public signet
  REGTEST // Regression test (local testing, no retargeting)
};

/**
 * Consensus parameters
 * Subset of Bitcoin's Consensus::Params needed to validate a header chain,
 * plus the proof-batch limits the circuit enforces.
 */
struct ConsensusParams {
  // Proof of Work
  uint256 powLimit;               // Maximum target (easiest difficulty)
  int64_t nPowTargetSpacing;      // Target time between blocks (in seconds)
  int64_t nPowTargetTimespan;     // Retarget period length (in seconds)
  bool fPowNoRetargeting{false};  // Keep nBits constant (regtest)

  // Version soft forks (height at which the minimum version is enforced)
  int32_t BIP34Height;            // nVersion >= 2
  int32_t BIP66Height;            // nVersion >= 3
  int32_t BIP65Height;            // nVersion >= 4

  // Hash of genesis block
  uint256 hashGenesisBlock;

  // Proof batch limits
  uint32_t nMaxMerkleDepth{32};         // Longest accepted Merkle path
  uint32_t nMaxHeadersPerBatch{20000};  // Most headers folded in one run
  uint32_t nFinalityDepth{4};           // Blocks below tip that count as final

  // Exact value of a bridge withdrawal output
  int64_t nBridgeAmountSats{100000000};

  int64_t DifficultyAdjustmentInterval() const {
    return nPowTargetTimespan / nPowTargetSpacing;
  }
};

/**
 * ChainParams - Chain-specific parameters
 * Simplified  version of Bitcoin's CChainParams
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  const ConsensusParams &GetConsensus() const { return consensus; }
  const CBlockHeader &GenesisBlock() const { return genesis; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  // Mutators (for CLI overrides)
  void SetMaxHeadersPerBatch(uint32_t n) { consensus.nMaxHeadersPerBatch = n; }
  void SetFinalityDepth(uint32_t depth) { consensus.nFinalityDepth = depth; }
  void SetBridgeAmount(int64_t sats) { consensus.nBridgeAmountSats = sats; }

  // Factory methods
  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateSignet();
  static std::unique_ptr<ChainParams> CreateRegTest();
  static std::unique_ptr<ChainParams> Create(ChainType chain);

protected:
  ConsensusParams consensus;
  ChainType chainType{ChainType::MAIN};
  CBlockHeader genesis;
};

/**
 * MainNet parameters
 */
class CMainParams : public ChainParams {
public:
  CMainParams();
};

/**
 * Signet parameters (default signet challenge)
 */
class CSignetParams : public ChainParams {
public:
  CSignetParams();
};

/**
 * RegTest parameters
 */
class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

// "main"/"mainnet", "signet", "regtest"; std::nullopt otherwise
std::optional<ChainType> ChainTypeFromString(std::string_view name);

// Helper to create genesis block (all networks share the same coinbase)
CBlockHeader CreateGenesisBlock(uint32_t nTime, uint32_t nNonce, uint32_t nBits,
                                int32_t nVersion = 1);

} // namespace chain
} // namespace spvproof
