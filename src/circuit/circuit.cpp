// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "circuit/circuit.hpp"
#include "chain/chain_accumulator.hpp"
#include "chain/chainparams.hpp"
#include "chain/transaction.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace spvproof {
namespace circuit {

using validation::ValidationError;
using validation::ValidationState;

namespace {

bool ResolveHeader(uint32_t index, const std::vector<CBlockHeader> &headers,
                   const CBlockHeader *&out, ValidationState &state) {
  if (index >= headers.size()) {
    return state.Invalid(ValidationError::HEADER_INDEX_OUT_OF_RANGE,
                         "bad-header-index",
                         "header index " + std::to_string(index) +
                             " but batch has " + std::to_string(headers.size()) +
                             " headers");
  }
  out = &headers[index];
  return true;
}

// Header hash `depth` blocks below the final tip, null if not in the batch
uint256 FinalizedHash(const chain::ChainState &checkpoint,
                      const std::vector<uint256> &hashes, uint32_t depth) {
  if (hashes.size() > depth) {
    return hashes[hashes.size() - 1 - depth];
  }
  if (hashes.size() == depth) {
    return checkpoint.tipHash;
  }
  return uint256();
}

} // namespace

bool ComputeInclusionLeaf(const InclusionLeaf &leaf, uint256 &out,
                          ValidationState &state) {
  if (const auto *digest = std::get_if<uint256>(&leaf)) {
    out = *digest;
    return true;
  }
  const auto &raw = std::get<std::vector<uint8_t>>(leaf);
  chain::CTransaction tx;
  std::string error;
  if (!tx.Deserialize(raw, error)) {
    return state.Invalid(ValidationError::MALFORMED_TRANSACTION, "bad-txns",
                         error);
  }
  out = tx.GetTxid();
  return true;
}

bool VerifyWithdrawal(const WithdrawalProof &proof,
                      const std::vector<CBlockHeader> &headers,
                      const chain::ConsensusParams &params,
                      ValidationState &state) {
  chain::CTransaction tx;
  std::string error;
  if (!tx.Deserialize(proof.rawTx, error)) {
    return state.Invalid(ValidationError::MALFORMED_TRANSACTION, "bad-txns",
                         error);
  }

  if (!tx.PaysTaproot(params.nBridgeAmountSats, proof.outputKey)) {
    return state.Invalid(ValidationError::WITHDRAWAL_OUTPUT_MISSING,
                         "bad-withdrawal-output",
                         "no output of " +
                             std::to_string(params.nBridgeAmountSats) +
                             " sats to " + proof.outputKey.GetRawHex());
  }

  const CBlockHeader *header = nullptr;
  if (!ResolveHeader(proof.headerIndex, headers, header, state)) {
    return false;
  }
  return chain::VerifyMerklePath(tx.GetTxid(), proof.path,
                                 header->hashMerkleRoot,
                                 params.nMaxMerkleDepth, state);
}

std::optional<Commitment> RunCircuit(const InputBatch &batch,
                                     const chain::ConsensusParams &params,
                                     ValidationState &state) {
  if (batch.headers.size() > params.nMaxHeadersPerBatch) {
    state.Invalid(ValidationError::BATCH_TOO_LARGE, "batch-too-large",
                  std::to_string(batch.headers.size()) + " headers, limit " +
                      std::to_string(params.nMaxHeadersPerBatch));
    return std::nullopt;
  }

  LOG_CIRCUIT_DEBUG("Running batch: {} headers, {} inclusions, {} withdrawals "
                    "from {}",
                    batch.headers.size(), batch.inclusions.size(),
                    batch.withdrawals.size(), batch.checkpoint.ToString());

  try {
    chain::ChainAccumulator accumulator(batch.checkpoint, params);
    CommitmentTree block_hashes;
    std::vector<uint256> hashes;
    hashes.reserve(batch.headers.size());

    for (size_t i = 0; i < batch.headers.size(); ++i) {
      validation::CheckedHeader checked;
      if (!accumulator.Apply(batch.headers[i], state, checked,
                             batch.adjustedTime)) {
        LOG_CIRCUIT_DEBUG("Header {} of batch rejected: {}", i,
                          state.ToString());
        return std::nullopt;
      }
      block_hashes.Add(checked.hash);
      hashes.push_back(checked.hash);
    }

    Commitment commitment;
    commitment.inclusionResults.reserve(batch.inclusions.size());
    for (const auto &request : batch.inclusions) {
      const CBlockHeader *header = nullptr;
      if (!ResolveHeader(request.headerIndex, batch.headers, header, state)) {
        LOG_CIRCUIT_DEBUG("Inclusion request {} malformed: {}",
                          request.requestId, state.ToString());
        return std::nullopt;
      }

      // Leaf bytes that do not decode name no transaction: committed false
      uint256 leaf;
      ValidationState leaf_state;
      const bool decoded = ComputeInclusionLeaf(request.leaf, leaf, leaf_state);
      if (!decoded) {
        LOG_CIRCUIT_DEBUG("Inclusion request {} leaf not decodable: {}",
                          request.requestId, leaf_state.ToString());
      }

      ValidationState path_state;
      bool verified = chain::VerifyMerklePath(leaf, request.path,
                                              header->hashMerkleRoot,
                                              params.nMaxMerkleDepth,
                                              path_state) &&
                      decoded;
      if (!path_state.IsValid() &&
          path_state.GetError() != ValidationError::INCLUSION_PROOF_FAILED) {
        state = path_state;
        LOG_CIRCUIT_DEBUG("Inclusion request {} malformed: {}",
                          request.requestId, state.ToString());
        return std::nullopt;
      }
      LOG_CIRCUIT_TRACE("Inclusion request {} in header {}: {}",
                        request.requestId, request.headerIndex, verified);
      commitment.inclusionResults.push_back({request.requestId, verified});
    }

    CommitmentTree withdrawals;
    for (size_t i = 0; i < batch.withdrawals.size(); ++i) {
      const auto &proof = batch.withdrawals[i];
      if (!VerifyWithdrawal(proof, batch.headers, params, state)) {
        LOG_CIRCUIT_DEBUG("Withdrawal {} rejected: {}", i, state.ToString());
        return std::nullopt;
      }
      withdrawals.Add(proof.outputKey);
    }

    const chain::ChainState &tip = accumulator.GetState();
    commitment.finalState = {tip.tipHash, tip.height, tip.chainWork};
    commitment.finalizedHash =
        FinalizedHash(batch.checkpoint, hashes, params.nFinalityDepth);
    commitment.blockHashesRoot = block_hashes.Root();
    commitment.blockHashCount = block_hashes.Size();
    commitment.withdrawalsRoot = withdrawals.Root();
    commitment.withdrawalCount = withdrawals.Size();

    LOG_CIRCUIT_DEBUG("Batch accepted: {}", commitment.ToString());
    return commitment;
  } catch (const std::overflow_error &e) {
    state.Error(ValidationError::ARITHMETIC_OVERFLOW, "arithmetic-overflow",
                e.what());
  } catch (const std::range_error &e) {
    state.Error(ValidationError::ARITHMETIC_OVERFLOW, "arithmetic-overflow",
                e.what());
  }
  return std::nullopt;
}

} // namespace circuit
} // namespace spvproof
