// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace spvproof {
namespace chain {

// Largest serialized transaction accepted (a block's weight limit in bytes)
static constexpr size_t MAX_TX_SIZE = 4000000;
// Largest CompactSize length prefix accepted (Bitcoin's MAX_SIZE)
static constexpr uint64_t MAX_COMPACT_SIZE = 0x02000000;
// Stripped size whose txid is indistinguishable from an inner Merkle node
static constexpr size_t MERKLE_NODE_TX_SIZE = 64;

// Taproot output script: OP_1 PUSH32 <x-only output key>
static constexpr uint8_t OP_1 = 0x51;
static constexpr size_t TAPROOT_SCRIPT_SIZE = 34;

struct COutPoint {
  uint256 hash;
  uint32_t n{0};
};

struct CTxIn {
  COutPoint prevout;
  std::vector<uint8_t> scriptSig;
  uint32_t nSequence{0xffffffff};
  std::vector<std::vector<uint8_t>> witness;
};

struct CTxOut {
  int64_t nValue{0};
  std::vector<uint8_t> scriptPubKey;

  // scriptPubKey is exactly OP_1 0x20 <outputKey>
  [[nodiscard]] bool IsTaprootTo(const uint256 &outputKey) const;
};

/**
 * CTransaction - decoded Bitcoin transaction
 *
 * Decoding accepts the legacy layout and the BIP144 segwit layout
 * (marker 0x00, flag 0x01, per-input witness stacks). The txid always
 * commits to the legacy serialization, so witness data never changes it.
 */
class CTransaction {
public:
  int32_t nVersion{2};
  std::vector<CTxIn> vin;
  std::vector<CTxOut> vout;
  uint32_t nLockTime{0};

  /**
   * Decode `bytes`, which must hold exactly one transaction.
   * Rejects truncation, trailing bytes, non-canonical CompactSize,
   * length prefixes larger than the remaining input, zero inputs, all-empty
   * witness sections, input larger than MAX_TX_SIZE, and transactions whose
   * serialization without witness is MERKLE_NODE_TX_SIZE bytes.
   * On failure `error` names the problem and the object is unspecified.
   */
  [[nodiscard]] bool Deserialize(std::span<const uint8_t> bytes,
                                 std::string &error);

  [[nodiscard]] std::vector<uint8_t> Serialize(bool with_witness = true) const;

  [[nodiscard]] bool HasWitness() const;

  // Double SHA-256 of the serialization without witness data
  [[nodiscard]] uint256 GetTxid() const;

  // Some output pays exactly `amount` to the taproot key `outputKey`
  [[nodiscard]] bool PaysTaproot(int64_t amount, const uint256 &outputKey) const;
};

// CompactSize length prefix (appended to `out`)
void WriteCompactSize(std::vector<uint8_t> &out, uint64_t n);

// OP_1 0x20 <key>
std::vector<uint8_t> TaprootScript(const uint256 &outputKey);

} // namespace chain
} // namespace spvproof
