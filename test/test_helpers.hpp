// Copyright (c) 2025 The Unicity Foundation
// Test helper that mines short regtest header chains with real transactions

#ifndef SPVPROOF_TEST_HELPERS_HPP
#define SPVPROOF_TEST_HELPERS_HPP

#include "chain/block.hpp"
#include "chain/chain_accumulator.hpp"
#include "chain/chain_state.hpp"
#include "chain/chainparams.hpp"
#include "chain/endian.hpp"
#include "chain/merkle.hpp"
#include "chain/miner.hpp"
#include "chain/transaction.hpp"
#include "crypto/sha256.hpp"
#include "util/string_parsing.hpp"
#include <stdexcept>
#include <vector>

namespace spvproof {
namespace test {

/**
 * Mainnet headers 1..3 (wire order). They extend
 * ChainState::FromGenesis(CreateMainNet()) with real difficulty-1 work.
 */
inline CBlockHeader MainnetHeader(int height) {
    static const char* const kHeaders[] = {
        "010000006fe28c0ab6f1b372c1a6a246ae63f74f931e8365e15a089c68d6190000000000"
        "982051fd1e4ba744bbbe680e1fee14677ba1a3c3540bf7b1cdb606e857233e0e61bc6649ffff001d01e36299",
        "010000004860eb18bf1b1620e37e9490fc8a427514416fd75159ab86688e9a8300000000"
        "d5fdcc541e25de1c7a5addedf24858b8bb665c9f36ef744ee42c316022c90f9bb0bc6649ffff001d08d2bd61",
        "01000000bddd99ccfda39da1b108ce1a5d70038d0a967bacb68b6b63065f626a00000000"
        "44f672226090d85db9a9f2fbfe5f0f9609b387af7be5b7fbb7a1767c831c9e995dbe6649ffff001d05e0ed6d",
    };
    if (height < 1 || height > 3) {
        throw std::out_of_range("only mainnet headers 1..3 are bundled");
    }
    auto bytes = util::ParseHexBytes(kHeaders[height - 1]);
    CBlockHeader header;
    if (!bytes || !header.Deserialize(*bytes)) {
        throw std::runtime_error("bad bundled header");
    }
    return header;
}

/**
 * One-input, one-output transaction. `tag` picks a distinct synthetic
 * outpoint so every tag yields a distinct txid.
 */
inline chain::CTransaction MakeTransaction(uint32_t tag, int64_t value,
                                           std::vector<uint8_t> script = {0x51}) {
    chain::CTransaction tx;
    chain::CTxIn in;
    unsigned char buf[4];
    endian::WriteLE32(buf, tag);
    in.prevout.hash = crypto::Sha256(buf);
    in.prevout.n = tag;
    in.scriptSig = {0x01, static_cast<uint8_t>(tag & 0xff)};
    tx.vin.push_back(in);
    chain::CTxOut out;
    out.nValue = value;
    out.scriptPubKey = std::move(script);
    tx.vout.push_back(out);
    return tx;
}

// Fixed x-only key used as the withdrawal destination in tests
inline uint256 TestOutputKey() {
    return *uint256::FromRawHex(
        "a60869f0dbcf1dc659c9cecbaf8050135ea9e8cdc487053f1dc6880949dc684c");
}

struct MinedBlock {
    CBlockHeader header;
    std::vector<chain::CTransaction> txs;

    std::vector<uint256> Txids() const {
        std::vector<uint256> txids;
        for (const auto& tx : txs) {
            txids.push_back(tx.GetTxid());
        }
        return txids;
    }

    chain::MerklePath PathFor(size_t index) const {
        auto path = chain::ComputeMerklePath(Txids(), index);
        if (!path) {
            throw std::out_of_range("transaction index out of range");
        }
        return *path;
    }
};

/**
 * TestChainBuilder - extends a checkpoint with mined regtest headers
 *
 * Usage:
 *   auto params = chain::ChainParams::CreateRegTest();
 *   TestChainBuilder builder(*params);
 *   builder.AddBlocks(3);
 *   batch.headers = builder.Headers();
 */
class TestChainBuilder {
public:
    explicit TestChainBuilder(const chain::ChainParams& params)
        : TestChainBuilder(chain::ChainState::FromGenesis(params), params.GetConsensus()) {}

    TestChainBuilder(chain::ChainState checkpoint, const chain::ConsensusParams& params)
        : checkpoint_(checkpoint), params_(params), accumulator_(std::move(checkpoint), params) {}

    // Mine one block holding `txs` (a single filler transaction if empty)
    const MinedBlock& AddBlock(std::vector<chain::CTransaction> txs = {},
                               uint32_t spacing = 600) {
        if (txs.empty()) {
            txs.push_back(MakeTransaction(next_tag_++, 5000));
        }
        MinedBlock block;
        block.txs = std::move(txs);

        const auto& tip = accumulator_.GetState();
        auto tmpl = mining::CreateBlockTemplate(tip, params_,
                                                chain::ComputeMerkleRoot(block.Txids()),
                                                tip.tipTime + spacing);
        if (!mining::MineHeader(tmpl.header, params_)) {
            throw std::runtime_error("nonce space exhausted");
        }
        validation::ValidationState state;
        if (!accumulator_.Apply(tmpl.header, state)) {
            throw std::runtime_error("mined header rejected: " + state.ToString());
        }
        block.header = tmpl.header;
        blocks_.push_back(std::move(block));
        return blocks_.back();
    }

    void AddBlocks(int n) {
        for (int i = 0; i < n; ++i) {
            AddBlock();
        }
    }

    std::vector<CBlockHeader> Headers() const {
        std::vector<CBlockHeader> headers;
        for (const auto& block : blocks_) {
            headers.push_back(block.header);
        }
        return headers;
    }

    const std::vector<MinedBlock>& Blocks() const { return blocks_; }
    const chain::ChainState& Checkpoint() const { return checkpoint_; }
    const chain::ChainState& Tip() const { return accumulator_.GetState(); }

private:
    chain::ChainState checkpoint_;
    const chain::ConsensusParams& params_;
    chain::ChainAccumulator accumulator_;
    std::vector<MinedBlock> blocks_;
    uint32_t next_tag_{1000};
};

} // namespace test
} // namespace spvproof

#endif // SPVPROOF_TEST_HELPERS_HPP
