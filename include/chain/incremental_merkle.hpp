// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/sha256.hpp"
#include "util/arith_uint256.hpp"
#include "util/uint.hpp"
#include <array>
#include <cstdint>

namespace spvproof {
namespace chain {

/**
 * IncrementalMerkleTree - append-only Merkle tree of fixed depth
 *
 * Leaves fill left to right; positions not yet written hold the null digest.
 * Only the rightmost path is stored, so Add() and Root() cost O(DEPTH)
 * regardless of how many leaves have been appended.
 *
 *   empty_[0]     = null leaf
 *   empty_[i + 1] = H(empty_[i] || empty_[i])
 *
 * Root() of a tree with no leaves is empty_[DEPTH].
 */
template <unsigned int DEPTH, typename Hasher = crypto::SingleSha256>
class IncrementalMerkleTree {
  static_assert(DEPTH >= 1 && DEPTH <= 63, "depth must fit a uint64_t leaf count");

public:
  static constexpr uint64_t CAPACITY = uint64_t{1} << DEPTH;

  IncrementalMerkleTree() {
    empty_[0].SetNull();
    for (unsigned int i = 0; i < DEPTH; ++i) {
      empty_[i + 1] = Hasher::Combine(empty_[i], empty_[i]);
    }
    root_ = empty_[DEPTH];
  }

  // Throws ArithmeticOverflow once CAPACITY leaves have been added
  void Add(const uint256 &leaf) {
    if (size_ >= CAPACITY) {
      throw ArithmeticOverflow("IncrementalMerkleTree: tree is full");
    }
    uint64_t index = size_;
    uint256 node = leaf;
    for (unsigned int level = 0; level < DEPTH; ++level) {
      if ((index & 1) == 0) {
        frontier_[level] = node;
        node = Hasher::Combine(node, empty_[level]);
      } else {
        node = Hasher::Combine(frontier_[level], node);
      }
      index >>= 1;
    }
    root_ = node;
    ++size_;
  }

  const uint256 &Root() const { return root_; }
  uint64_t Size() const { return size_; }

  // Root of the subtree of height `level` holding no leaves
  const uint256 &EmptyRoot(unsigned int level) const { return empty_.at(level); }

private:
  std::array<uint256, DEPTH + 1> empty_;
  // frontier_[i]: last left child written at level i
  std::array<uint256, DEPTH> frontier_{};
  uint256 root_;
  uint64_t size_{0};
};

} // namespace chain
} // namespace spvproof
