// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Proof-of-Work tests
//
// Retarget vectors are real mainnet periods (Bitcoin Core pow_tests):
//   - block 32256: first real difficulty increase
//   - genesis period: slow blocks, result capped at powLimit
//   - block 68544: fast period, clamped to a 4x harder target
//   - block 46368: slow period, clamped to a 4x easier target

#include <catch2/catch_test_macros.hpp>
#include "chain/chain_state.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "util/arith_uint256.hpp"

using namespace spvproof;

TEST_CASE("PoW - CalculateNextWorkRequired mainnet vectors", "[pow][retarget]") {
    auto params = chain::ChainParams::CreateMainNet();
    const auto& consensus = params->GetConsensus();

    SECTION("Retarget at block 32256") {
        REQUIRE(consensus::CalculateNextWorkRequired(0x1d00ffff, 1262152739 - 1261130161,
                                                     consensus) == 0x1d00d86aU);
    }

    SECTION("Result is capped at powLimit") {
        REQUIRE(consensus::CalculateNextWorkRequired(0x1d00ffff, 1233061996 - 1231006505,
                                                     consensus) == 0x1d00ffffU);
    }

    SECTION("Fast period is clamped to a quarter of the timespan") {
        REQUIRE(consensus::CalculateNextWorkRequired(0x1c05a3f4, 1279297671 - 1279008237,
                                                     consensus) == 0x1c0168fdU);
    }

    SECTION("Slow period is clamped to four times the timespan") {
        REQUIRE(consensus::CalculateNextWorkRequired(0x1c387f6f, 1269211443 - 1263163443,
                                                     consensus) == 0x1d00e1fdU);
    }
}

TEST_CASE("PoW - retarget clamp limits", "[pow][retarget]") {
    auto params = chain::ChainParams::CreateMainNet();
    const auto& consensus = params->GetConsensus();
    const int64_t timespan = consensus.nPowTargetTimespan;

    SECTION("Anything faster than a quarter gives exactly 4x harder") {
        REQUIRE(consensus::CalculateNextWorkRequired(0x1b0404cb, 0, consensus) == 0x1b010132U);
        REQUIRE(consensus::CalculateNextWorkRequired(0x1b0404cb, -5000, consensus) == 0x1b010132U);
        REQUIRE(consensus::CalculateNextWorkRequired(0x1b0404cb, timespan / 4, consensus) == 0x1b010132U);
    }

    SECTION("Anything slower than four times gives exactly 4x easier") {
        REQUIRE(consensus::CalculateNextWorkRequired(0x1b0404cb, timespan * 4, consensus) == 0x1b10132cU);
        REQUIRE(consensus::CalculateNextWorkRequired(0x1b0404cb, timespan * 100, consensus) == 0x1b10132cU);
    }

    SECTION("On-schedule period keeps the target") {
        REQUIRE(consensus::CalculateNextWorkRequired(0x1b0404cb, timespan, consensus) == 0x1b0404cbU);
    }

    SECTION("Repeated evaluation is identical") {
        const uint32_t first = consensus::CalculateNextWorkRequired(0x1b0404cb, 1, consensus);
        for (int i = 0; i < 10; ++i) {
            REQUIRE(consensus::CalculateNextWorkRequired(0x1b0404cb, 1, consensus) == first);
        }
    }
}

TEST_CASE("PoW - GetNextWorkRequired reads the chain state", "[pow][retarget]") {
    auto params = chain::ChainParams::CreateMainNet();
    const auto& consensus = params->GetConsensus();

    chain::ChainState tip;
    tip.tipBits = 0x1d00ffff;
    tip.tipTime = 1262152739;
    tip.periodStartTime = 1261130161;

    SECTION("Last block of a period triggers the retarget") {
        tip.height = 32255;
        REQUIRE(consensus::GetNextWorkRequired(tip, consensus) == 0x1d00d86aU);
    }

    SECTION("Other heights keep the tip's bits") {
        tip.height = 32254;
        REQUIRE(consensus::GetNextWorkRequired(tip, consensus) == 0x1d00ffffU);
        tip.height = 32256;
        REQUIRE(consensus::GetNextWorkRequired(tip, consensus) == 0x1d00ffffU);
    }

    SECTION("Regtest never retargets") {
        auto regtest = chain::ChainParams::CreateRegTest();
        tip.height = 2015;
        tip.tipBits = 0x207fffff;
        REQUIRE(consensus::GetNextWorkRequired(tip, regtest->GetConsensus()) == 0x207fffffU);
    }
}

TEST_CASE("PoW - target decoding", "[pow]") {
    auto params = chain::ChainParams::CreateMainNet();
    const auto& consensus = params->GetConsensus();

    SECTION("Valid target") {
        auto target = consensus::DecodeTarget(0x1d00ffff, consensus);
        REQUIRE(target.has_value());
        REQUIRE(target->GetHex() ==
                "00000000ffff0000000000000000000000000000000000000000000000000000");
    }

    SECTION("Zero, negative, overflowing and too-easy targets are rejected") {
        REQUIRE_FALSE(consensus::DecodeTarget(0x00000000, consensus).has_value());
        REQUIRE_FALSE(consensus::DecodeTarget(0x1d000000, consensus).has_value());
        REQUIRE_FALSE(consensus::DecodeTarget(0x1d80ffff, consensus).has_value());
        REQUIRE_FALSE(consensus::DecodeTarget(0xff123456, consensus).has_value());
        REQUIRE_FALSE(consensus::DecodeTarget(0x1d01ffff, consensus).has_value());
        REQUIRE_FALSE(consensus::DecodeTarget(0x207fffff, consensus).has_value());
    }

    SECTION("Regtest accepts its own easy target") {
        auto regtest = chain::ChainParams::CreateRegTest();
        REQUIRE(consensus::DecodeTarget(0x207fffff, regtest->GetConsensus()).has_value());
    }
}

TEST_CASE("PoW - block proof", "[pow]") {
    SECTION("Difficulty-1 block") {
        REQUIRE(consensus::GetBlockProof(0x1d00ffffU) == arith_uint256(0x100010001ULL));
    }

    SECTION("Invalid bits carry no work") {
        REQUIRE(consensus::GetBlockProof(0x00000000U) == arith_uint256(0));
        REQUIRE(consensus::GetBlockProof(0x1d80ffffU) == arith_uint256(0));
        REQUIRE(consensus::GetBlockProof(0xff123456U) == arith_uint256(0));
    }

    SECTION("Harder targets carry more work") {
        REQUIRE(consensus::GetBlockProof(0x1c05a3f4U) > consensus::GetBlockProof(0x1d00ffffU));
        REQUIRE(consensus::GetBlockProof(0x207fffffU) == arith_uint256(2));
    }
}

TEST_CASE("PoW - CheckProofOfWork", "[pow]") {
    auto params = chain::ChainParams::CreateMainNet();
    const auto& consensus = params->GetConsensus();

    const uint256 genesis_hash =
        uint256S("000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f");
    REQUIRE(consensus::CheckProofOfWork(genesis_hash, 0x1d00ffff, consensus));

    SECTION("Hash above target fails") {
        REQUIRE_FALSE(consensus::CheckProofOfWork(
            uint256S("00000001ffffffffffffffffffffffffffffffffffffffffffffffffffffffff"),
            0x1d00ffff, consensus));
    }

    SECTION("Hash equal to target passes, one above fails") {
        arith_uint256 target = *consensus::DecodeTarget(0x1d00ffff, consensus);
        REQUIRE(consensus::CheckProofOfWork(ArithToUint256(target), 0x1d00ffff, consensus));
        REQUIRE_FALSE(consensus::CheckProofOfWork(ArithToUint256(target + arith_uint256(1)),
                                                  0x1d00ffff, consensus));
    }

    SECTION("Invalid bits fail") {
        REQUIRE_FALSE(consensus::CheckProofOfWork(genesis_hash, 0x1d80ffff, consensus));
    }
}

TEST_CASE("PoW - GetDifficulty", "[pow]") {
    REQUIRE(consensus::GetDifficulty(0x1d00ffff) == 1.0);
    REQUIRE(consensus::GetDifficulty(0x1c00ffff) == 256.0);
    REQUIRE(consensus::GetDifficulty(0x1d000000) == 0.0);
}
