// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Fuzz target for CTransaction decoding (inclusion leaves, withdrawals)

#include "chain/transaction.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

using namespace spvproof;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    chain::CTransaction tx;
    std::string error;
    if (!tx.Deserialize(std::span<const uint8_t>(data, size), error)) {
        // Every rejection names its reason
        if (error.empty()) {
            __builtin_trap();
        }
        return 0;
    }

    // Accepted input is canonical: re-encoding gives back the same bytes
    auto serialized = tx.Serialize();
    if (serialized.size() != size ||
        !std::equal(serialized.begin(), serialized.end(), data)) {
        __builtin_trap();
    }

    // Witness data never changes the txid
    chain::CTransaction stripped;
    auto legacy = tx.Serialize(false);
    if (legacy.size() == chain::MERKLE_NODE_TX_SIZE) {
        __builtin_trap();
    }
    if (!stripped.Deserialize(legacy, error) || stripped.GetTxid() != tx.GetTxid()) {
        __builtin_trap();
    }

    return 0;
}
