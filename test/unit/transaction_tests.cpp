// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/transaction.hpp"
#include "crypto/sha256.hpp"
#include "test_helpers.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

using namespace spvproof;
using namespace spvproof::chain;

namespace {

// Coinbase of the mainnet genesis block
const char* const kGenesisCoinbase =
    "01000000010000000000000000000000000000000000000000000000000000000000000000ffffffff"
    "4d04ffff001d0104455468652054696d65732030332f4a616e2f32303039204368616e63656c6c6f72"
    "206f6e206272696e6b206f66207365636f6e64206261696c6f757420666f722062616e6b73ffffffff"
    "0100f2052a01000000434104678afdb0fe5548271967f1a67130b7105cd6a828e03909a67962e0ea1f"
    "61deb649f6bc3f4cef38c4f35504e51ec112de5c384df7ba0b8d578a4c702b6bf11d5fac00000000";

std::vector<uint8_t> GenesisCoinbaseBytes() {
    return *util::ParseHexBytes(kGenesisCoinbase);
}

bool Decodes(const std::vector<uint8_t>& bytes, std::string& error) {
    CTransaction tx;
    return tx.Deserialize(bytes, error);
}

} // namespace

TEST_CASE("Decode the genesis coinbase", "[transaction]") {
    const auto bytes = GenesisCoinbaseBytes();
    REQUIRE(bytes.size() == 204);

    CTransaction tx;
    std::string error;
    REQUIRE(tx.Deserialize(bytes, error));
    REQUIRE(error.empty());
    REQUIRE(tx.nVersion == 1);
    REQUIRE(tx.vin.size() == 1);
    REQUIRE(tx.vin[0].prevout.hash.IsNull());
    REQUIRE(tx.vin[0].prevout.n == 0xffffffff);
    REQUIRE(tx.vin[0].scriptSig.size() == 0x4d);
    REQUIRE(tx.vout.size() == 1);
    REQUIRE(tx.vout[0].nValue == 5000000000LL);
    REQUIRE(tx.nLockTime == 0);
    REQUIRE_FALSE(tx.HasWitness());

    REQUIRE(tx.GetTxid().GetHex() ==
            "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
    // The genesis block has one transaction, so its txid is the merkle root
    auto params = ChainParams::CreateMainNet();
    REQUIRE(tx.GetTxid() == params->GenesisBlock().hashMerkleRoot);

    REQUIRE(tx.Serialize() == bytes);
}

TEST_CASE("Segwit transactions", "[transaction]") {
    CTransaction tx = test::MakeTransaction(7, 20000);
    const uint256 legacy_txid = tx.GetTxid();
    const auto legacy_bytes = tx.Serialize();

    tx.vin[0].witness = {{0xaa, 0xbb}, {}};
    REQUIRE(tx.HasWitness());
    REQUIRE(tx.GetTxid() == legacy_txid);

    const auto bytes = tx.Serialize();
    REQUIRE(bytes.size() > legacy_bytes.size());
    REQUIRE(bytes[4] == 0x00);
    REQUIRE(bytes[5] == 0x01);
    REQUIRE(tx.Serialize(false) == legacy_bytes);

    CTransaction decoded;
    std::string error;
    REQUIRE(decoded.Deserialize(bytes, error));
    REQUIRE(decoded.HasWitness());
    REQUIRE(decoded.vin[0].witness.size() == 2);
    REQUIRE(decoded.vin[0].witness[1].empty());
    REQUIRE(decoded.GetTxid() == legacy_txid);
    REQUIRE(decoded.Serialize() == bytes);
}

TEST_CASE("Malformed transactions are rejected", "[transaction]") {
    const auto good = GenesisCoinbaseBytes();
    std::string error;

    SECTION("Empty input") {
        REQUIRE_FALSE(Decodes({}, error));
        REQUIRE(error == "truncated version");
    }

    SECTION("Truncated at every length") {
        for (size_t len = 0; len < good.size(); ++len) {
            std::vector<uint8_t> cut(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(len));
            error.clear();
            REQUIRE_FALSE(Decodes(cut, error));
            REQUIRE_FALSE(error.empty());
        }
    }

    SECTION("Trailing bytes") {
        auto bytes = good;
        bytes.push_back(0x00);
        REQUIRE_FALSE(Decodes(bytes, error));
        REQUIRE(error == "1 trailing bytes");
    }

    SECTION("Non-canonical input count") {
        std::vector<uint8_t> bytes(good.begin(), good.begin() + 4);
        bytes.insert(bytes.end(), {0xfd, 0x01, 0x00});
        bytes.insert(bytes.end(), good.begin() + 5, good.end());
        REQUIRE_FALSE(Decodes(bytes, error));
        REQUIRE(error == "non-canonical compact size");
    }

    SECTION("Input count larger than the data") {
        std::vector<uint8_t> bytes(good.begin(), good.begin() + 4);
        bytes.push_back(0xfc);
        bytes.insert(bytes.end(), good.begin() + 5, good.end());
        REQUIRE_FALSE(Decodes(bytes, error));
        REQUIRE(error == "input count exceeds remaining input");
    }

    SECTION("Unknown segwit flag") {
        const std::vector<uint8_t> bytes = {0x02, 0x00, 0x00, 0x00, 0x00, 0x02, 0x01};
        REQUIRE_FALSE(Decodes(bytes, error));
        REQUIRE(error == "unknown segwit flag");
    }

    SECTION("No inputs") {
        // Segwit marker, then an input count of zero
        const std::vector<uint8_t> bytes = {0x02, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00,
                                            0x00, 0x00, 0x00, 0x00, 0x00};
        REQUIRE_FALSE(Decodes(bytes, error));
        REQUIRE(error == "transaction has no inputs");
    }

    SECTION("Witness section with only empty stacks") {
        const auto legacy = test::MakeTransaction(3, 1000).Serialize();
        std::vector<uint8_t> bytes(legacy.begin(), legacy.begin() + 4);
        bytes.insert(bytes.end(), {0x00, 0x01});
        bytes.insert(bytes.end(), legacy.begin() + 4, legacy.end() - 4);
        bytes.push_back(0x00);
        bytes.insert(bytes.end(), legacy.end() - 4, legacy.end());
        REQUIRE_FALSE(Decodes(bytes, error));
        REQUIRE(error == "superfluous witness record");
    }

    SECTION("Oversized input") {
        std::vector<uint8_t> bytes(MAX_TX_SIZE + 1, 0x00);
        REQUIRE_FALSE(Decodes(bytes, error));
        REQUIRE(error.find("larger than") != std::string::npos);
    }
}

TEST_CASE("64-byte transactions are rejected", "[transaction]") {
    std::string error;

    SECTION("Two-byte script gives a 64-byte legacy transaction") {
        const auto bytes = test::MakeTransaction(9, 5000, {0x51, 0x51}).Serialize();
        REQUIRE(bytes.size() == MERKLE_NODE_TX_SIZE);

        // Its txid is the parent hash of its two halves
        const uint256 left(std::span<const uint8_t>(bytes).first(32));
        const uint256 right(std::span<const uint8_t>(bytes).last(32));
        REQUIRE(crypto::Hash(bytes) == crypto::Hash(left, right));

        REQUIRE_FALSE(Decodes(bytes, error));
        REQUIRE(error == "stripped size of 64 bytes");
    }

    SECTION("Witness data does not count towards the size") {
        CTransaction tx = test::MakeTransaction(9, 5000, {0x51, 0x51});
        tx.vin[0].witness = {{0xaa, 0xbb, 0xcc}};
        const auto bytes = tx.Serialize();
        REQUIRE(bytes.size() > MERKLE_NODE_TX_SIZE);
        REQUIRE(tx.Serialize(false).size() == MERKLE_NODE_TX_SIZE);
        REQUIRE_FALSE(Decodes(bytes, error));
        REQUIRE(error == "stripped size of 64 bytes");
    }

    SECTION("Neighbouring sizes decode") {
        const auto shorter = test::MakeTransaction(9, 5000, {0x51}).Serialize();
        const auto longer = test::MakeTransaction(9, 5000, {0x51, 0x51, 0x51}).Serialize();
        REQUIRE(shorter.size() == MERKLE_NODE_TX_SIZE - 1);
        REQUIRE(longer.size() == MERKLE_NODE_TX_SIZE + 1);
        REQUIRE(Decodes(shorter, error));
        REQUIRE(Decodes(longer, error));
    }
}

TEST_CASE("WriteCompactSize uses the shortest encoding", "[transaction]") {
    struct Case {
        uint64_t n;
        std::vector<uint8_t> expected;
    };
    const std::vector<Case> cases = {
        {0, {0x00}},
        {0xfc, {0xfc}},
        {0xfd, {0xfd, 0xfd, 0x00}},
        {0xffff, {0xfd, 0xff, 0xff}},
        {0x10000, {0xfe, 0x00, 0x00, 0x01, 0x00}},
        {0x100000000ULL, {0xff, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00}},
    };
    for (const auto& c : cases) {
        std::vector<uint8_t> out;
        WriteCompactSize(out, c.n);
        REQUIRE(out == c.expected);
    }
}

TEST_CASE("Taproot outputs", "[transaction]") {
    const uint256 key = test::TestOutputKey();
    const auto script = TaprootScript(key);
    REQUIRE(script.size() == TAPROOT_SCRIPT_SIZE);
    REQUIRE(script[0] == OP_1);
    REQUIRE(script[1] == 0x20);
    REQUIRE(std::equal(key.begin(), key.end(), script.begin() + 2));

    const CTransaction tx = test::MakeTransaction(1, 100000000, script);
    REQUIRE(tx.PaysTaproot(100000000, key));
    REQUIRE_FALSE(tx.PaysTaproot(99999999, key));

    uint256 other = key;
    other.begin()[31] ^= 0x01;
    REQUIRE_FALSE(tx.PaysTaproot(100000000, other));

    CTxOut out;
    out.scriptPubKey = script;
    out.scriptPubKey.push_back(0x00);
    REQUIRE_FALSE(out.IsTaprootTo(key));
    out.scriptPubKey = script;
    out.scriptPubKey[0] = 0x00;
    REQUIRE_FALSE(out.IsTaprootTo(key));
}
