// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Fuzz target for CBlockHeader decoding and the header check table
// Headers arrive from the host untrusted; every path must reject cleanly

#include "chain/block.hpp"
#include "chain/chain_state.hpp"
#include "chain/chainparams.hpp"
#include "chain/validation.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>

using namespace spvproof;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static const auto params = chain::ChainParams::CreateRegTest();
    static const chain::ChainState genesis = chain::ChainState::FromGenesis(*params);

    CBlockHeader header;
    if (!header.Deserialize(data, size)) {
        // Anything but exactly 80 bytes is rejected
        if (size == CBlockHeader::HEADER_SIZE) {
            __builtin_trap();
        }
        return 0;
    }

    // Serialization must reproduce the input byte for byte
    auto serialized = header.Serialize();
    if (serialized.size() != size ||
        !std::equal(serialized.begin(), serialized.end(), data)) {
        __builtin_trap();
    }

    // Hash must be deterministic
    if (header.GetHash() != header.GetHash()) {
        __builtin_trap();
    }

    // Checks may reject, but must always classify the rejection
    validation::ValidationState state;
    validation::CheckedHeader checked;
    const validation::HeaderContext ctx{genesis, params->GetConsensus(), std::nullopt};
    if (!validation::CheckBlockHeader(header, ctx, checked, state)) {
        if (!state.IsInvalid() ||
            state.GetError() == validation::ValidationError::NONE) {
            __builtin_trap();
        }
    }

    return 0;
}
