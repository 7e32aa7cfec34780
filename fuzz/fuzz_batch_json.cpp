// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Fuzz target for the JSON batch codec and a full circuit run on regtest

#include "chain/chainparams.hpp"
#include "circuit/batch_json.hpp"
#include "circuit/circuit.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

using namespace spvproof;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static const auto params = chain::ChainParams::CreateRegTest();

    circuit::InputBatch batch;
    try {
        batch = circuit::ParseInputBatch(
            std::string_view(reinterpret_cast<const char *>(data), size));
    } catch (const circuit::BatchFormatError &) {
        return 0;
    }

    validation::ValidationState state;
    auto commitment = circuit::RunCircuit(batch, params->GetConsensus(), state);
    if (!commitment) {
        if (state.IsValid()) {
            // Rejection without a reason - BUG!
            __builtin_trap();
        }
        return 0;
    }

    // Same input must give the same commitment
    validation::ValidationState state2;
    auto again = circuit::RunCircuit(batch, params->GetConsensus(), state2);
    if (!again || *again != *commitment) {
        __builtin_trap();
    }

    return 0;
}
