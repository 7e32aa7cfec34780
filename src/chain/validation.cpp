// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/block.hpp"
#include "chain/chain_state.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include <sstream>

namespace spvproof {
namespace validation {

const char *ValidationErrorToString(ValidationError error) {
  switch (error) {
  case ValidationError::NONE:
    return "NONE";
  case ValidationError::LINKAGE_MISMATCH:
    return "LINKAGE_MISMATCH";
  case ValidationError::INVALID_TARGET:
    return "INVALID_TARGET";
  case ValidationError::PROOF_OF_WORK_NOT_MET:
    return "PROOF_OF_WORK_NOT_MET";
  case ValidationError::TIMESTAMP_OUT_OF_RANGE:
    return "TIMESTAMP_OUT_OF_RANGE";
  case ValidationError::DIFFICULTY_MISMATCH:
    return "DIFFICULTY_MISMATCH";
  case ValidationError::INCLUSION_PROOF_FAILED:
    return "INCLUSION_PROOF_FAILED";
  case ValidationError::PATH_TOO_LONG:
    return "PATH_TOO_LONG";
  case ValidationError::ARITHMETIC_OVERFLOW:
    return "ARITHMETIC_OVERFLOW";
  case ValidationError::BAD_VERSION:
    return "BAD_VERSION";
  case ValidationError::MALFORMED_TRANSACTION:
    return "MALFORMED_TRANSACTION";
  case ValidationError::WITHDRAWAL_OUTPUT_MISSING:
    return "WITHDRAWAL_OUTPUT_MISSING";
  case ValidationError::HEADER_INDEX_OUT_OF_RANGE:
    return "HEADER_INDEX_OUT_OF_RANGE";
  case ValidationError::BATCH_TOO_LARGE:
    return "BATCH_TOO_LARGE";
  }
  return "UNKNOWN";
}

std::string ValidationState::ToString() const {
  if (IsValid()) {
    return "valid";
  }
  std::string s = std::string(ValidationErrorToString(error_)) + ": " +
                  reject_reason_;
  if (!debug_message_.empty()) {
    s += " (" + debug_message_ + ")";
  }
  return s;
}

bool CheckLinkage(const CBlockHeader &header, const HeaderContext &ctx,
                  CheckedHeader &, ValidationState &state) {
  if (header.hashPrevBlock != ctx.prev.tipHash) {
    return state.Invalid(ValidationError::LINKAGE_MISMATCH, "bad-prevblk",
                         "previous block " + header.hashPrevBlock.GetHex() +
                             " is not the tip " + ctx.prev.tipHash.GetHex());
  }
  return true;
}

bool CheckTarget(const CBlockHeader &header, const HeaderContext &ctx,
                 CheckedHeader &out, ValidationState &state) {
  auto target = consensus::DecodeTarget(header.nBits, ctx.params);
  if (!target) {
    std::ostringstream msg;
    msg << "nBits 0x" << std::hex << header.nBits
        << " is not a valid target for this network";
    return state.Invalid(ValidationError::INVALID_TARGET,
                         "bad-diffbits-encoding", msg.str());
  }
  out.target = *target;
  return true;
}

bool CheckProofOfWork(const CBlockHeader &header, const HeaderContext &ctx,
                      CheckedHeader &out, ValidationState &state) {
  out.hash = header.GetHash();
  if (!consensus::CheckProofOfWork(out.hash, header.nBits, ctx.params)) {
    return state.Invalid(ValidationError::PROOF_OF_WORK_NOT_MET, "high-hash",
                         "proof of work failed for " + out.hash.GetHex());
  }
  return true;
}

bool CheckTimestamp(const CBlockHeader &header, const HeaderContext &ctx,
                    CheckedHeader &, ValidationState &state) {
  const int64_t median_time_past = ctx.prev.GetMedianTimePast();
  if (header.GetBlockTime() <= median_time_past) {
    return state.Invalid(
        ValidationError::TIMESTAMP_OUT_OF_RANGE, "time-too-old",
        "block's timestamp is too early: " + std::to_string(header.nTime) +
            " <= " + std::to_string(median_time_past));
  }

  if (ctx.adjusted_time &&
      header.GetBlockTime() > *ctx.adjusted_time + MAX_FUTURE_BLOCK_TIME) {
    return state.Invalid(
        ValidationError::TIMESTAMP_OUT_OF_RANGE, "time-too-new",
        "block timestamp too far in future: " + std::to_string(header.nTime) +
            " > " + std::to_string(*ctx.adjusted_time + MAX_FUTURE_BLOCK_TIME));
  }
  return true;
}

bool CheckVersion(const CBlockHeader &header, const HeaderContext &ctx,
                  CheckedHeader &, ValidationState &state) {
  const int64_t height = static_cast<int64_t>(ctx.prev.height) + 1;
  const auto &params = ctx.params;

  int32_t min_version = 1;
  if (height >= params.BIP65Height) {
    min_version = 4;
  } else if (height >= params.BIP66Height) {
    min_version = 3;
  } else if (height >= params.BIP34Height) {
    min_version = 2;
  }

  if (header.nVersion < min_version) {
    return state.Invalid(ValidationError::BAD_VERSION, "bad-version",
                         "version " + std::to_string(header.nVersion) +
                             " below " + std::to_string(min_version) +
                             " at height " + std::to_string(height));
  }
  return true;
}

const std::array<HeaderCheck, 5> &HeaderChecks() {
  static const std::array<HeaderCheck, 5> checks = {{
      {"linkage", &CheckLinkage},
      {"target", &CheckTarget},
      {"proof-of-work", &CheckProofOfWork},
      {"timestamp", &CheckTimestamp},
      {"version", &CheckVersion},
  }};
  return checks;
}

bool CheckBlockHeader(const CBlockHeader &header, const HeaderContext &ctx,
                      CheckedHeader &out, ValidationState &state) {
  for (const auto &check : HeaderChecks()) {
    if (!check.fn(header, ctx, out, state)) {
      LOG_CHAIN_DEBUG("Header at height {} failed {} check: {}",
                      ctx.prev.height + 1, check.name, state.ToString());
      return false;
    }
  }
  return true;
}

bool ContextualCheckBlockHeader(const CBlockHeader &header,
                                const chain::ChainState &prev,
                                const chain::ConsensusParams &params,
                                ValidationState &state) {
  const uint32_t expected_bits = consensus::GetNextWorkRequired(prev, params);
  if (header.nBits != expected_bits) {
    std::ostringstream msg;
    msg << "incorrect difficulty: expected 0x" << std::hex << expected_bits
        << ", got 0x" << header.nBits;
    return state.Invalid(ValidationError::DIFFICULTY_MISMATCH, "bad-diffbits",
                         msg.str());
  }
  return true;
}

} // namespace validation
} // namespace spvproof
