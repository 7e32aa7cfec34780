// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace spvproof {
namespace crypto {

void EVPContextDeleter::operator()(EVP_MD_CTX *ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  Reset();
}

CSHA256 &CSHA256::Write(const unsigned char *data, size_t len) {
  if (len == 0) {
    return *this;
  }
  if (finalized_) {
    throw std::logic_error("CSHA256::Write after Finalize without Reset");
  }
  if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("Failed to update SHA256");
  }
  return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
  if (finalized_) {
    throw std::logic_error("CSHA256::Finalize called twice without Reset");
  }
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &len) != 1 || len != OUTPUT_SIZE) {
    throw std::runtime_error("Failed to finalize SHA256");
  }
  finalized_ = true;
}

CSHA256 &CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256");
  }
  finalized_ = false;
  return *this;
}

void CHash256::Finalize(std::span<unsigned char> output) {
  if (output.size() != OUTPUT_SIZE) {
    throw std::invalid_argument("CHash256::Finalize needs a 32-byte buffer");
  }
  unsigned char buf[CSHA256::OUTPUT_SIZE];
  sha_.Finalize(buf);
  sha_.Reset().Write(buf, sizeof(buf)).Finalize(output.data());
}

uint256 DoubleSha256::Digest(std::span<const unsigned char> bytes) {
  uint256 out;
  CHash256().Write(bytes).Finalize(std::span<unsigned char>(out.begin(), out.size()));
  return out;
}

uint256 DoubleSha256::Combine(const uint256 &left, const uint256 &right) {
  uint256 out;
  CHash256()
      .Write(std::span<const unsigned char>(left.begin(), left.size()))
      .Write(std::span<const unsigned char>(right.begin(), right.size()))
      .Finalize(std::span<unsigned char>(out.begin(), out.size()));
  return out;
}

uint256 SingleSha256::Digest(std::span<const unsigned char> bytes) {
  uint256 out;
  CSHA256().Write(bytes).Finalize(out.begin());
  return out;
}

uint256 SingleSha256::Combine(const uint256 &left, const uint256 &right) {
  uint256 out;
  CSHA256()
      .Write(left.begin(), left.size())
      .Write(right.begin(), right.size())
      .Finalize(out.begin());
  return out;
}

} // namespace crypto
} // namespace spvproof
