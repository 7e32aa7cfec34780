// Copyright (c) 2015-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/merkle.hpp"

namespace spvproof {
namespace chain {

std::optional<MerklePath> MerklePath::FromIndex(const std::vector<uint256> &branch,
                                                uint32_t index) {
  if (branch.size() < 32 && (index >> branch.size()) != 0) {
    return std::nullopt;
  }
  MerklePath path;
  for (const auto &sibling : branch) {
    path.Append(sibling, (index & 1) ? MerkleSide::LEFT : MerkleSide::RIGHT);
    index >>= 1;
  }
  return path;
}

/*     WARNING! If you're reading this because you're learning about crypto
       and/or designing a new system that will use merkle trees, keep in mind
       that the following merkle tree algorithm has a serious flaw related to
       duplicate txids, resulting in a vulnerability (CVE-2012-2459).

       The reason is that if the number of hashes in the list at a given level
       is odd, the last one is duplicated before computing the next level (which
       is unusual in Merkle trees). This results in certain sequences of
       transactions leading to the same merkle root. */
uint256 ComputeMerkleRoot(std::vector<uint256> hashes, bool *mutated) {
  bool mutation = false;
  while (hashes.size() > 1) {
    if (mutated) {
      for (size_t pos = 0; pos + 1 < hashes.size(); pos += 2) {
        if (hashes[pos] == hashes[pos + 1]) mutation = true;
      }
    }
    if (hashes.size() & 1) {
      hashes.push_back(hashes.back());
    }
    for (size_t pos = 0; pos < hashes.size() / 2; ++pos) {
      hashes[pos] = crypto::Hash(hashes[2 * pos], hashes[2 * pos + 1]);
    }
    hashes.resize(hashes.size() / 2);
  }
  if (mutated) *mutated = mutation;
  if (hashes.empty()) return uint256();
  return hashes[0];
}

std::optional<MerklePath> ComputeMerklePath(const std::vector<uint256> &hashes,
                                            size_t index) {
  if (index >= hashes.size()) {
    return std::nullopt;
  }
  MerklePath path;
  std::vector<uint256> level = hashes;
  while (level.size() > 1) {
    if (level.size() & 1) {
      level.push_back(level.back());
    }
    if (index & 1) {
      path.Append(level[index - 1], MerkleSide::LEFT);
    } else {
      path.Append(level[index + 1], MerkleSide::RIGHT);
    }
    for (size_t pos = 0; pos < level.size() / 2; ++pos) {
      level[pos] = crypto::Hash(level[2 * pos], level[2 * pos + 1]);
    }
    level.resize(level.size() / 2);
    index >>= 1;
  }
  return path;
}

} // namespace chain
} // namespace spvproof
