// Copyright (c) 2015-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "chain/validation.hpp"
#include "crypto/sha256.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spvproof {
namespace chain {

// Which side of the running node the sibling sits on
enum class MerkleSide : uint8_t { LEFT, RIGHT };

struct MerkleStep {
  uint256 sibling;
  MerkleSide side{MerkleSide::RIGHT};
};

/**
 * MerklePath - siblings from leaf to root
 *
 * Step i combines the running node with steps[i].sibling:
 *   LEFT : H(sibling || node)
 *   RIGHT: H(node || sibling)
 */
class MerklePath {
public:
  MerklePath() = default;
  explicit MerklePath(std::vector<MerkleStep> steps) : steps_(std::move(steps)) {}

  /**
   * Convert a Bitcoin (branch, index) proof. Bit i of `index` set means the
   * node at level i is a right child, so its sibling is on the LEFT.
   * std::nullopt if `index` has bits at or above branch.size().
   */
  static std::optional<MerklePath> FromIndex(const std::vector<uint256> &branch,
                                             uint32_t index);

  void Append(const uint256 &sibling, MerkleSide side) {
    steps_.push_back({sibling, side});
  }

  const std::vector<MerkleStep> &Steps() const { return steps_; }
  size_t size() const { return steps_.size(); }
  bool empty() const { return steps_.empty(); }

private:
  std::vector<MerkleStep> steps_;
};

// Fold `leaf` up `path` with the compile-time selected hasher
template <typename Hasher = crypto::DoubleSha256>
uint256 FoldMerklePath(const uint256 &leaf, const MerklePath &path) {
  uint256 node = leaf;
  for (const auto &step : path.Steps()) {
    node = step.side == MerkleSide::LEFT ? Hasher::Combine(step.sibling, node)
                                         : Hasher::Combine(node, step.sibling);
  }
  return node;
}

/**
 * CONSENSUS-CRITICAL: membership of `leaf` under `root`.
 *
 * PATH_TOO_LONG if the path has more than max_depth steps (nothing is
 * hashed), INCLUSION_PROOF_FAILED if the folded path does not reproduce
 * `root`. An empty path proves leaf == root.
 */
template <typename Hasher = crypto::DoubleSha256>
bool VerifyMerklePath(const uint256 &leaf, const MerklePath &path,
                      const uint256 &root, uint32_t max_depth,
                      validation::ValidationState &state) {
  if (path.size() > max_depth) {
    return state.Invalid(validation::ValidationError::PATH_TOO_LONG,
                         "merkle-path-too-long",
                         std::to_string(path.size()) + " steps, limit " +
                             std::to_string(max_depth));
  }
  const uint256 computed = FoldMerklePath<Hasher>(leaf, path);
  if (computed != root) {
    return state.Invalid(validation::ValidationError::INCLUSION_PROOF_FAILED,
                         "bad-merkle-root",
                         "path reduces to " + computed.GetHex() +
                             ", expected " + root.GetHex());
  }
  return true;
}

/**
 * Bitcoin transaction-tree root. An odd level duplicates its last node.
 * If `mutated` is given it is set when two identical siblings were hashed
 * (the CVE-2012-2459 ambiguity). Empty input gives a null root.
 */
uint256 ComputeMerkleRoot(std::vector<uint256> hashes, bool *mutated = nullptr);

// Path for hashes[index] under ComputeMerkleRoot(hashes); nullopt if out of range
std::optional<MerklePath> ComputeMerklePath(const std::vector<uint256> &hashes,
                                            size_t index);

} // namespace chain
} // namespace spvproof
