// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"

namespace spvproof {
namespace chain {

namespace {
// Merkle root of the genesis coinbase ("The Times 03/Jan/2009 ...")
constexpr const char *kGenesisMerkleRoot =
    "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";
} // namespace

CBlockHeader CreateGenesisBlock(uint32_t nTime, uint32_t nNonce, uint32_t nBits,
                                int32_t nVersion) {
  CBlockHeader genesis;
  genesis.nVersion = nVersion;
  genesis.hashPrevBlock.SetNull();
  genesis.hashMerkleRoot = uint256S(kGenesisMerkleRoot);
  genesis.nTime = nTime;
  genesis.nBits = nBits;
  genesis.nNonce = nNonce;
  return genesis;
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::SIGNET:
    return "signet";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

std::optional<ChainType> ChainTypeFromString(std::string_view name) {
  if (name == "main" || name == "mainnet") {
    return ChainType::MAIN;
  }
  if (name == "signet") {
    return ChainType::SIGNET;
  }
  if (name == "regtest") {
    return ChainType::REGTEST;
  }
  return std::nullopt;
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateSignet() {
  return std::make_unique<CSignetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

std::unique_ptr<ChainParams> ChainParams::Create(ChainType chain) {
  switch (chain) {
  case ChainType::MAIN:
    return CreateMainNet();
  case ChainType::SIGNET:
    return CreateSignet();
  case ChainType::REGTEST:
    return CreateRegTest();
  }
  return CreateMainNet();
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  consensus.powLimit = uint256S(
      "00000000ffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
  consensus.nPowTargetSpacing = 10 * 60;           // 10 minutes
  consensus.nPowTargetTimespan = 14 * 24 * 60 * 60; // two weeks (2016 blocks)
  consensus.fPowNoRetargeting = false;

  consensus.BIP34Height = 227931;
  consensus.BIP66Height = 363725;
  consensus.BIP65Height = 388381;

  genesis = CreateGenesisBlock(1231006505, 2083236893, 0x1d00ffff, 1);
  // 000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f
  consensus.hashGenesisBlock = genesis.GetHash();
}

// ============================================================================
// Signet Parameters
// ============================================================================

CSignetParams::CSignetParams() {
  chainType = ChainType::SIGNET;

  consensus.powLimit = uint256S(
      "00000377ae000000000000000000000000000000000000000000000000000000");
  consensus.nPowTargetSpacing = 10 * 60;
  consensus.nPowTargetTimespan = 14 * 24 * 60 * 60;
  consensus.fPowNoRetargeting = false;

  consensus.BIP34Height = 1;
  consensus.BIP66Height = 1;
  consensus.BIP65Height = 1;

  genesis = CreateGenesisBlock(1598918400, 52613770, 0x1e0377ae, 1);
  // 00000008819873e925422c1ff0f99f7cc9bbb232af63a077a480a3633bee1ef6
  consensus.hashGenesisBlock = genesis.GetHash();
}

// ============================================================================
// RegTest Parameters (Local testing)
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;

  // Very easy difficulty - instant block generation
  consensus.powLimit = uint256S(
      "7fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
  consensus.nPowTargetSpacing = 10 * 60;
  consensus.nPowTargetTimespan = 14 * 24 * 60 * 60;
  consensus.fPowNoRetargeting = true;

  consensus.BIP34Height = 1;
  consensus.BIP66Height = 1;
  consensus.BIP65Height = 1;

  genesis = CreateGenesisBlock(1296688602, 2, 0x207fffff, 1);
  // 0f9188f13cb7b2c71f2a335e3a4fc328bf5beb436012afca590b1a11466e2206
  consensus.hashGenesisBlock = genesis.GetHash();
}

} // namespace chain
} // namespace spvproof
