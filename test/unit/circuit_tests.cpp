// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "circuit/circuit.hpp"
#include "chain/chainparams.hpp"
#include "chain/transaction.hpp"
#include "test_helpers.hpp"
#include <memory>
#include <vector>

using namespace spvproof;
using namespace spvproof::circuit;
using chain::ChainParams;
using chain::CTransaction;
using validation::ValidationError;
using validation::ValidationState;

namespace {

/**
 * Regtest batch of three blocks. The last block holds a filler, a tracked
 * transaction and a withdrawal paying the bridge amount to TestOutputKey().
 */
struct BatchFixture {
    std::unique_ptr<ChainParams> params = ChainParams::CreateRegTest();
    test::TestChainBuilder builder{*params};
    CTransaction tracked = test::MakeTransaction(1, 4242);
    CTransaction payout = test::MakeTransaction(
        2, params->GetConsensus().nBridgeAmountSats, chain::TaprootScript(test::TestOutputKey()));

    BatchFixture() {
        builder.AddBlocks(2);
        builder.AddBlock({test::MakeTransaction(3, 1), tracked, payout});
    }

    const test::MinedBlock& Last() const { return builder.Blocks().back(); }

    InputBatch Batch() const {
        InputBatch batch;
        batch.checkpoint = builder.Checkpoint();
        batch.headers = builder.Headers();

        InclusionRequest request;
        request.requestId = 77;
        request.headerIndex = 2;
        request.leaf = tracked.Serialize();
        request.path = Last().PathFor(1);
        batch.inclusions.push_back(request);

        WithdrawalProof proof;
        proof.outputKey = test::TestOutputKey();
        proof.rawTx = payout.Serialize();
        proof.path = Last().PathFor(2);
        proof.headerIndex = 2;
        batch.withdrawals.push_back(proof);
        return batch;
    }

    const chain::ConsensusParams& Consensus() const { return params->GetConsensus(); }
};

} // namespace

TEST_CASE("RunCircuit accepts a valid regtest batch", "[circuit]") {
    BatchFixture f;
    const InputBatch batch = f.Batch();

    ValidationState state;
    auto commitment = RunCircuit(batch, f.Consensus(), state);
    REQUIRE(commitment.has_value());
    REQUIRE(state.IsValid());

    REQUIRE(commitment->finalState.tipHash == f.builder.Tip().tipHash);
    REQUIRE(commitment->finalState.height == batch.checkpoint.height + 3);
    REQUIRE(commitment->finalState.chainWork > batch.checkpoint.chainWork);
    REQUIRE(commitment->finalState.chainWork == f.builder.Tip().chainWork);

    REQUIRE(commitment->inclusionResults.size() == 1);
    REQUIRE(commitment->inclusionResults[0] == InclusionResult{77, true});

    CommitmentTree block_hashes;
    for (const auto& header : batch.headers) {
        block_hashes.Add(header.GetHash());
    }
    REQUIRE(commitment->blockHashCount == 3);
    REQUIRE(commitment->blockHashesRoot == block_hashes.Root());

    CommitmentTree withdrawals;
    withdrawals.Add(test::TestOutputKey());
    REQUIRE(commitment->withdrawalCount == 1);
    REQUIRE(commitment->withdrawalsRoot == withdrawals.Root());

    // Three headers with finality depth 4: nothing in the batch is final yet
    REQUIRE(commitment->finalizedHash.IsNull());
}

TEST_CASE("RunCircuit is deterministic", "[circuit]") {
    BatchFixture f;
    const InputBatch batch = f.Batch();
    ValidationState a;
    ValidationState b;
    auto first = RunCircuit(batch, f.Consensus(), a);
    auto second = RunCircuit(batch, f.Consensus(), b);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->Serialize() == second->Serialize());
    REQUIRE(first->GetHash() == second->GetHash());
}

TEST_CASE("RunCircuit inclusion outcomes", "[circuit]") {
    BatchFixture f;
    InputBatch batch = f.Batch();

    SECTION("A different transaction is committed as unverified") {
        CTransaction other = f.tracked;
        other.vout[0].nValue += 1;
        batch.inclusions[0].leaf = other.Serialize();
        ValidationState state;
        auto commitment = RunCircuit(batch, f.Consensus(), state);
        REQUIRE(commitment.has_value());
        REQUIRE(commitment->inclusionResults[0] == InclusionResult{77, false});
    }

    SECTION("Digest leaves are accepted") {
        batch.inclusions[0].leaf = f.tracked.GetTxid();
        ValidationState state;
        auto commitment = RunCircuit(batch, f.Consensus(), state);
        REQUIRE(commitment.has_value());
        REQUIRE(commitment->inclusionResults[0].verified);
    }

    SECTION("Proof against the wrong header fails without aborting") {
        batch.inclusions[0].headerIndex = 1;
        ValidationState state;
        auto commitment = RunCircuit(batch, f.Consensus(), state);
        REQUIRE(commitment.has_value());
        REQUIRE_FALSE(commitment->inclusionResults[0].verified);
    }

    SECTION("Results keep request order") {
        InclusionRequest second = batch.inclusions[0];
        second.requestId = 3;
        second.leaf = f.payout.GetTxid();
        second.path = f.Last().PathFor(2);
        InclusionRequest third = batch.inclusions[0];
        third.requestId = 1;
        third.leaf = f.payout.GetTxid();
        batch.inclusions.push_back(second);
        batch.inclusions.push_back(third);
        ValidationState state;
        auto commitment = RunCircuit(batch, f.Consensus(), state);
        REQUIRE(commitment.has_value());
        REQUIRE(commitment->inclusionResults ==
                std::vector<InclusionResult>{{77, true}, {3, true}, {1, false}});
    }

    SECTION("Header index past the batch aborts") {
        batch.inclusions[0].headerIndex = 3;
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::HEADER_INDEX_OUT_OF_RANGE);
    }

    SECTION("Undecodable leaf bytes are committed as unverified") {
        ValidationState clean_state;
        const auto clean = RunCircuit(batch, f.Consensus(), clean_state);
        REQUIRE(clean.has_value());
        REQUIRE(clean->inclusionResults[0].verified);

        // Input count 0x01 becomes 0x03, which runs past the data
        auto corrupted_count = f.tracked.Serialize();
        corrupted_count[4] ^= 0x02;
        auto trailing = f.tracked.Serialize();
        trailing.push_back(0x00);

        for (const auto& raw : {corrupted_count, trailing}) {
            batch.inclusions[0].leaf = raw;
            ValidationState state;
            auto commitment = RunCircuit(batch, f.Consensus(), state);
            REQUIRE(commitment.has_value());
            REQUIRE(state.IsValid());
            REQUIRE(commitment->inclusionResults[0] == InclusionResult{77, false});
            REQUIRE(commitment->finalState.height == clean->finalState.height);
            REQUIRE(commitment->finalState.chainWork == clean->finalState.chainWork);
            REQUIRE(commitment->finalState.tipHash == clean->finalState.tipHash);
        }
    }

    SECTION("Undecodable leaf with an overlong path still aborts") {
        batch.inclusions[0].leaf = std::vector<uint8_t>{0x01, 0x02, 0x03};
        chain::MerklePath path;
        for (int i = 0; i < 33; ++i) {
            path.Append(uint256::ONE, chain::MerkleSide::RIGHT);
        }
        batch.inclusions[0].path = path;
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::PATH_TOO_LONG);
    }

    SECTION("Overlong path aborts") {
        chain::MerklePath path;
        for (int i = 0; i < 33; ++i) {
            path.Append(uint256::ONE, chain::MerkleSide::RIGHT);
        }
        batch.inclusions[0].path = path;
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::PATH_TOO_LONG);
    }
}

TEST_CASE("RunCircuit withdrawals", "[circuit]") {
    BatchFixture f;
    InputBatch batch = f.Batch();

    SECTION("Wrong output key") {
        uint256 key = test::TestOutputKey();
        key.begin()[0] ^= 0x80;
        batch.withdrawals[0].outputKey = key;
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::WITHDRAWAL_OUTPUT_MISSING);
    }

    SECTION("Wrong bridge amount") {
        auto params = ChainParams::CreateRegTest();
        params->SetBridgeAmount(f.Consensus().nBridgeAmountSats / 2);
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, params->GetConsensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::WITHDRAWAL_OUTPUT_MISSING);
    }

    SECTION("Transaction not in the claimed block") {
        batch.withdrawals[0].headerIndex = 0;
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::INCLUSION_PROOF_FAILED);
    }

    SECTION("Header index out of range") {
        batch.withdrawals[0].headerIndex = 10;
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::HEADER_INDEX_OUT_OF_RANGE);
    }

    SECTION("Garbage bytes") {
        batch.withdrawals[0].rawTx = {0x01, 0x02, 0x03};
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::MALFORMED_TRANSACTION);
    }

    SECTION("VerifyWithdrawal on its own") {
        ValidationState state;
        REQUIRE(VerifyWithdrawal(batch.withdrawals[0], batch.headers, f.Consensus(), state));
    }
}

TEST_CASE("RunCircuit refuses 64-byte transactions", "[circuit]") {
    auto params = ChainParams::CreateRegTest();
    const auto& consensus = params->GetConsensus();

    // A two-byte script makes this a 64-byte transaction
    const CTransaction short_tx = test::MakeTransaction(5, 5000, {0x51, 0x51});
    REQUIRE(short_tx.Serialize().size() == chain::MERKLE_NODE_TX_SIZE);

    test::TestChainBuilder builder{*params};
    builder.AddBlock({test::MakeTransaction(4, 1), short_tx});
    const auto& block = builder.Blocks().back();

    InputBatch batch;
    batch.checkpoint = builder.Checkpoint();
    batch.headers = builder.Headers();

    SECTION("Inclusion of its raw bytes is unverified") {
        InclusionRequest request;
        request.requestId = 9;
        request.headerIndex = 0;
        request.leaf = short_tx.Serialize();
        request.path = block.PathFor(1);
        batch.inclusions.push_back(request);

        ValidationState state;
        auto commitment = RunCircuit(batch, consensus, state);
        REQUIRE(commitment.has_value());
        REQUIRE(commitment->inclusionResults[0] == InclusionResult{9, false});
    }

    SECTION("Withdrawal carrying it is malformed") {
        WithdrawalProof proof;
        proof.outputKey = test::TestOutputKey();
        proof.rawTx = short_tx.Serialize();
        proof.path = block.PathFor(1);
        proof.headerIndex = 0;
        batch.withdrawals.push_back(proof);

        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, consensus, state).has_value());
        REQUIRE(state.GetError() == ValidationError::MALFORMED_TRANSACTION);
    }
}

TEST_CASE("RunCircuit header failures abort the batch", "[circuit]") {
    BatchFixture f;
    InputBatch batch = f.Batch();

    SECTION("Headers out of order") {
        std::swap(batch.headers[0], batch.headers[1]);
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::LINKAGE_MISMATCH);
    }

    SECTION("Batch limit") {
        auto params = ChainParams::CreateRegTest();
        params->SetMaxHeadersPerBatch(2);
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, params->GetConsensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::BATCH_TOO_LARGE);
    }

    SECTION("Checkpoint from another network") {
        auto mainnet = ChainParams::CreateMainNet();
        batch.checkpoint = chain::ChainState::FromGenesis(*mainnet);
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::LINKAGE_MISMATCH);
    }

    SECTION("Cumulative work overflow") {
        batch.checkpoint.chainWork = ~arith_uint256(0);
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, f.Consensus(), state).has_value());
        REQUIRE(state.IsError());
        REQUIRE(state.GetError() == ValidationError::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("RunCircuit finalized hash", "[circuit]") {
    auto params = ChainParams::CreateRegTest();
    test::TestChainBuilder builder(*params);
    builder.AddBlocks(6);

    InputBatch batch;
    batch.checkpoint = builder.Checkpoint();
    batch.headers = builder.Headers();

    SECTION("Deeper than the finality depth") {
        ValidationState state;
        auto commitment = RunCircuit(batch, params->GetConsensus(), state);
        REQUIRE(commitment.has_value());
        // Six headers, depth four: the second header is final
        REQUIRE(commitment->finalizedHash == batch.headers[1].GetHash());
    }

    SECTION("Exactly the finality depth finalizes the checkpoint") {
        params->SetFinalityDepth(6);
        ValidationState state;
        auto commitment = RunCircuit(batch, params->GetConsensus(), state);
        REQUIRE(commitment.has_value());
        REQUIRE(commitment->finalizedHash == batch.checkpoint.tipHash);
    }

    SECTION("Depth zero finalizes the tip") {
        params->SetFinalityDepth(0);
        ValidationState state;
        auto commitment = RunCircuit(batch, params->GetConsensus(), state);
        REQUIRE(commitment.has_value());
        REQUIRE(commitment->finalizedHash == commitment->finalState.tipHash);
    }
}

TEST_CASE("RunCircuit with no headers commits the checkpoint", "[circuit]") {
    auto params = ChainParams::CreateRegTest();
    InputBatch batch;
    batch.checkpoint = chain::ChainState::FromGenesis(*params);
    ValidationState state;
    auto commitment = RunCircuit(batch, params->GetConsensus(), state);
    REQUIRE(commitment.has_value());
    REQUIRE(commitment->finalState.tipHash == batch.checkpoint.tipHash);
    REQUIRE(commitment->finalState.height == 0);
    REQUIRE(commitment->blockHashCount == 0);
    REQUIRE(commitment->blockHashesRoot == CommitmentTree().Root());
    REQUIRE(commitment->inclusionResults.empty());
}

TEST_CASE("RunCircuit on mainnet headers", "[circuit]") {
    auto params = ChainParams::CreateMainNet();
    InputBatch batch;
    batch.checkpoint = chain::ChainState::FromGenesis(*params);
    for (int height = 1; height <= 3; ++height) {
        batch.headers.push_back(test::MainnetHeader(height));
    }

    // Each of these blocks holds only its coinbase, so the txid is the root
    InclusionRequest request;
    request.requestId = 1;
    request.headerIndex = 1;
    request.leaf = batch.headers[1].hashMerkleRoot;
    batch.inclusions.push_back(request);

    SECTION("Accepted") {
        ValidationState state;
        auto commitment = RunCircuit(batch, params->GetConsensus(), state);
        REQUIRE(commitment.has_value());
        REQUIRE(commitment->finalState.height == 3);
        REQUIRE(commitment->finalState.tipHash.GetHex() ==
                "0000000082b5015589a3fdf2d4baff403e6f0be035a5d9742c1cae6295464449");
        REQUIRE(commitment->finalState.chainWork ==
                arith_uint256(0x100010001ULL) * arith_uint256(4));
        REQUIRE(commitment->inclusionResults[0].verified);
    }

    SECTION("Tampered merkle root fails proof of work") {
        batch.headers[0].hashMerkleRoot.begin()[0] ^= 0x01;
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, params->GetConsensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::PROOF_OF_WORK_NOT_MET);
    }

    SECTION("Adjusted time before the headers rejects them") {
        batch.adjustedTime = static_cast<int64_t>(params->GenesisBlock().nTime);
        ValidationState state;
        REQUIRE_FALSE(RunCircuit(batch, params->GetConsensus(), state).has_value());
        REQUIRE(state.GetError() == ValidationError::TIMESTAMP_OUT_OF_RANGE);
    }
}
