// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "circuit/circuit.hpp"
#include "circuit/commitment.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace spvproof {
namespace circuit {

/**
 * Host-side JSON codec for input batches and commitments.
 *
 * Batch document:
 *
 *   {
 *     "checkpoint": {
 *       "tip_hash": "<display hex>", "height": 0, "chain_work": "<hex>",
 *       "bits": "1d00ffff" | 486604799, "time": 0,
 *       "period_start_time": 0, "recent_times": [0, ...]
 *     },
 *     "headers": [ "<160 hex chars, wire order>" |
 *                  { "version", "prev_block", "merkle_root",
 *                    "time", "bits", "nonce" } ],
 *     "inclusions": [ { "request_id", "header_index",
 *                       "tx": "<raw hex>" | "leaf": "<display hex>",
 *                       "path": <path> } ],
 *     "withdrawals": [ { "output_key": "<64 hex, script order>",
 *                        "tx": "<raw hex>", "header_index", "path": <path> } ],
 *     "adjusted_time": 0            (optional)
 *   }
 *
 * <path> is either [ { "hash": "<display hex>", "side": "left"|"right" } ]
 * or { "branch": [ "<display hex>", ... ], "index": n }.
 *
 * Digests use Bitcoin display order (byte-reversed), as printed by
 * bitcoin-cli; raw transactions and serialized headers use wire order.
 */

// Any structural problem with a batch document. The message names the field.
class BatchFormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

InputBatch ParseInputBatch(const nlohmann::json &j);
InputBatch ParseInputBatch(std::string_view text);

nlohmann::json InputBatchToJson(const InputBatch &batch);

// Commitment fields plus "commitment_hash" (display hex of GetHash())
nlohmann::json CommitmentToJson(const Commitment &commitment);

} // namespace circuit
} // namespace spvproof
