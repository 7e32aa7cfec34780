// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chain_state.hpp"
#include "chain/incremental_merkle.hpp"
#include "chain/merkle.hpp"
#include "chain/validation.hpp"
#include "circuit/commitment.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace spvproof {

namespace chain {
struct ConsensusParams;
} // namespace chain

namespace circuit {

// Depth of the committed block-hash and withdrawal trees
static constexpr unsigned int COMMITMENT_TREE_DEPTH = 32;
using CommitmentTree = chain::IncrementalMerkleTree<COMMITMENT_TREE_DEPTH>;

// Raw transaction bytes (leaf = txid) or an already computed leaf digest
using InclusionLeaf = std::variant<std::vector<uint8_t>, uint256>;

/**
 * Claim that `leaf` is in the transaction tree of batch header
 * `headerIndex` (0 = first header after the checkpoint).
 */
struct InclusionRequest {
  uint64_t requestId{0};
  uint32_t headerIndex{0};
  InclusionLeaf leaf;
  chain::MerklePath path;
};

/**
 * Bridge withdrawal: `rawTx` pays exactly the bridge amount to the taproot
 * key `outputKey` and is included in batch header `headerIndex`.
 * outputKey is held in script byte order.
 */
struct WithdrawalProof {
  uint256 outputKey;
  std::vector<uint8_t> rawTx;
  chain::MerklePath path;
  uint32_t headerIndex{0};
};

struct InputBatch {
  chain::ChainState checkpoint;
  std::vector<CBlockHeader> headers;
  std::vector<InclusionRequest> inclusions;
  std::vector<WithdrawalProof> withdrawals;
  // Host wall-clock reading; enables the time-too-new rule when present
  std::optional<int64_t> adjustedTime;
};

/**
 * Fold the batch onto its checkpoint and build the Commitment.
 *
 * Fail-fast: the first header or withdrawal that does not validate aborts
 * the run, returning std::nullopt with the classified reason in `state`, as
 * does an inclusion request with a bad header index or an over-long path.
 * An inclusion request whose leaf bytes do not decode as a transaction, or
 * whose path does not reach the header's Merkle root, is not an abort; it is
 * committed with verified = false.
 *
 * Deterministic: equal inputs always give byte-identical commitments.
 */
std::optional<Commitment> RunCircuit(const InputBatch &batch,
                                     const chain::ConsensusParams &params,
                                     validation::ValidationState &state);

/**
 * Leaf digest of an inclusion request (txid for raw transactions).
 * MALFORMED_TRANSACTION if the bytes do not decode.
 */
bool ComputeInclusionLeaf(const InclusionLeaf &leaf, uint256 &out,
                          validation::ValidationState &state);

/**
 * Check one withdrawal against the validated batch headers.
 * Failure classes: MALFORMED_TRANSACTION, WITHDRAWAL_OUTPUT_MISSING,
 * HEADER_INDEX_OUT_OF_RANGE, PATH_TOO_LONG, INCLUSION_PROOF_FAILED.
 */
bool VerifyWithdrawal(const WithdrawalProof &proof,
                      const std::vector<CBlockHeader> &headers,
                      const chain::ConsensusParams &params,
                      validation::ValidationState &state);

} // namespace circuit
} // namespace spvproof
