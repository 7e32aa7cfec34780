// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "circuit/commitment.hpp"
#include "chain/endian.hpp"
#include "chain/transaction.hpp"
#include "crypto/sha256.hpp"
#include <sstream>

namespace spvproof {
namespace circuit {

namespace {

void AppendHash(std::vector<uint8_t> &out, const uint256 &h) {
  out.insert(out.end(), h.begin(), h.end());
}

void AppendLE32(std::vector<uint8_t> &out, uint32_t v) {
  uint8_t buf[4];
  endian::WriteLE32(buf, v);
  out.insert(out.end(), buf, buf + 4);
}

void AppendLE64(std::vector<uint8_t> &out, uint64_t v) {
  uint8_t buf[8];
  endian::WriteLE64(buf, v);
  out.insert(out.end(), buf, buf + 8);
}

} // namespace

std::vector<uint8_t> Commitment::Serialize() const {
  std::vector<uint8_t> out;
  out.reserve(32 * 5 + 4 + 8 * 2 + 9 + inclusionResults.size() * 9);

  AppendHash(out, finalState.tipHash);
  AppendLE32(out, static_cast<uint32_t>(finalState.height));
  AppendHash(out, ArithToUint256(finalState.chainWork));
  AppendHash(out, finalizedHash);
  AppendHash(out, blockHashesRoot);
  AppendLE64(out, blockHashCount);
  AppendHash(out, withdrawalsRoot);
  AppendLE64(out, withdrawalCount);

  chain::WriteCompactSize(out, inclusionResults.size());
  for (const auto &r : inclusionResults) {
    AppendLE64(out, r.requestId);
    out.push_back(r.verified ? 1 : 0);
  }
  return out;
}

uint256 Commitment::GetHash() const {
  const auto bytes = Serialize();
  return crypto::Hash(std::span<const unsigned char>(bytes.data(), bytes.size()));
}

std::string Commitment::ToString() const {
  std::stringstream s;
  s << "Commitment(tip=" << finalState.tipHash.GetHex()
    << ", height=" << finalState.height
    << ", work=" << finalState.chainWork.GetHex()
    << ", finalized=" << finalizedHash.GetHex()
    << ", blocks=" << blockHashCount
    << ", withdrawals=" << withdrawalCount
    << ", inclusions=" << inclusionResults.size() << ")";
  return s.str();
}

} // namespace circuit
} // namespace spvproof
