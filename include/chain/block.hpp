// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/uint.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

// CBlockHeader - Bitcoin block header
// The 80-byte serialization is the preimage of the block hash. Nothing else
// about a block is needed to validate the header chain; transactions are
// proven against hashMerkleRoot separately.
class CBlockHeader
{
public:
    int32_t nVersion{0};
    uint256 hashPrevBlock{};        // Hash of previous block header (copied byte-for-byte as stored, no endian swap)
    uint256 hashMerkleRoot{};       // Root of the block's transaction tree (copied byte-for-byte as stored)
    uint32_t nTime{0};              // Unix timestamp
    uint32_t nBits{0};              // Difficulty target (compact format)
    uint32_t nNonce{0};             // Nonce for proof-of-work

    // Wire format constants
    static constexpr size_t UINT256_BYTES = 32;

    // Serialized header size: 4 + 32 + 32 + 4 + 4 + 4 = 80 bytes
    static constexpr size_t HEADER_SIZE =
        4 +                          // nVersion (int32_t)
        UINT256_BYTES +              // hashPrevBlock
        UINT256_BYTES +              // hashMerkleRoot
        4 +                          // nTime (uint32_t)
        4 +                          // nBits (uint32_t)
        4;                           // nNonce (uint32_t)

    // Field offsets within the 80-byte header
    static constexpr size_t OFF_VERSION  = 0;
    static constexpr size_t OFF_PREV     = OFF_VERSION + 4;
    static constexpr size_t OFF_MERKLE   = OFF_PREV + UINT256_BYTES;
    static constexpr size_t OFF_TIME     = OFF_MERKLE + UINT256_BYTES;
    static constexpr size_t OFF_BITS     = OFF_TIME + 4;
    static constexpr size_t OFF_NONCE    = OFF_BITS + 4;

    static_assert(sizeof(uint256) == UINT256_BYTES, "uint256 must be 32 bytes");
    static_assert(HEADER_SIZE == 80, "Header size must be 80 bytes");
    static_assert(OFF_NONCE + 4 == HEADER_SIZE, "offset math must be correct");

    using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

    void SetNull() noexcept
    {
        nVersion = 0;
        hashPrevBlock.SetNull();
        hashMerkleRoot.SetNull();
        nTime = 0;
        nBits = 0;
        nNonce = 0;
    }

    [[nodiscard]] bool IsNull() const noexcept
    {
        return nBits == 0;
    }

    // Double SHA-256 of the 80-byte serialization
    [[nodiscard]] uint256 GetHash() const;

    // Scalars little-endian, digests copied byte-for-byte as stored
    [[nodiscard]] HeaderBytes SerializeFixed() const noexcept;

    [[nodiscard]] std::vector<uint8_t> Serialize() const;

    // Rejects any input that is not exactly HEADER_SIZE bytes
    [[nodiscard]] bool Deserialize(const uint8_t* data, size_t size) noexcept;

    [[nodiscard]] bool Deserialize(std::span<const uint8_t> bytes) noexcept {
        return Deserialize(bytes.data(), bytes.size());
    }

    template <size_t N>
    [[nodiscard]] bool Deserialize(const std::array<uint8_t, N>& bytes) noexcept {
        if constexpr (N != HEADER_SIZE) return false;
        return Deserialize(bytes.data(), bytes.size());
    }

    [[nodiscard]] int64_t GetBlockTime() const noexcept
    {
        return static_cast<int64_t>(nTime);
    }

    [[nodiscard]] std::string ToString() const;
};
