// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

// Forward declaration (OpenSSL)
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace spvproof {
namespace crypto {

struct EVPContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const noexcept;
};

/**
 * Streaming SHA-256 over OpenSSL's EVP interface.
 *
 * The digest depends only on the concatenation of everything passed to
 * Write(); callers may split input at arbitrary boundaries.
 *
 * Throws std::runtime_error if OpenSSL fails to allocate or drive the
 * context. That never happens for well-formed input.
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  CSHA256(CSHA256 &&) noexcept = default;
  CSHA256 &operator=(CSHA256 &&) noexcept = default;
  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;
  ~CSHA256() = default;

  CSHA256 &Write(const unsigned char *data, size_t len);
  CSHA256 &Write(std::span<const unsigned char> data) {
    return Write(data.data(), data.size());
  }
  void Finalize(unsigned char hash[OUTPUT_SIZE]);
  CSHA256 &Reset();

private:
  std::unique_ptr<EVP_MD_CTX, EVPContextDeleter> ctx_;
  bool finalized_{false};
};

/** Bitcoin's double SHA-256: SHA256(SHA256(x)). */
class CHash256 {
public:
  static constexpr size_t OUTPUT_SIZE = CSHA256::OUTPUT_SIZE;

  CHash256 &Write(std::span<const unsigned char> input) {
    sha_.Write(input.data(), input.size());
    return *this;
  }

  void Finalize(std::span<unsigned char> output);

  CHash256 &Reset() {
    sha_.Reset();
    return *this;
  }

private:
  CSHA256 sha_;
};

/**
 * Compile-time hash strategies for tree hashing. Each exposes
 * Combine(left, right) and Digest(bytes); Merkle code is templated on them
 * so the choice of primitive is fixed at build time.
 */
struct DoubleSha256 {
  static uint256 Digest(std::span<const unsigned char> bytes);
  static uint256 Combine(const uint256 &left, const uint256 &right);
};

struct SingleSha256 {
  static uint256 Digest(std::span<const unsigned char> bytes);
  static uint256 Combine(const uint256 &left, const uint256 &right);
};

/** Double SHA-256 of a byte string. */
inline uint256 Hash(std::span<const unsigned char> bytes) {
  return DoubleSha256::Digest(bytes);
}

/** Double SHA-256 of the concatenation of two digests. */
inline uint256 Hash(const uint256 &a, const uint256 &b) {
  return DoubleSha256::Combine(a, b);
}

/** Single SHA-256 of a byte string. */
inline uint256 Sha256(std::span<const unsigned char> bytes) {
  return SingleSha256::Digest(bytes);
}

} // namespace crypto
} // namespace spvproof
