// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

class CBlockHeader;

namespace spvproof {

namespace chain {
struct ChainState;
struct ConsensusParams;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * BLOCK HEADER VALIDATION ARCHITECTURE
 * ============================================================================
 *
 * LAYER 1: Header checks (CheckBlockHeader)
 * An ordered table of independent, named checks run against the tip the
 * header claims to extend:
 *   1. CheckLinkage      : hashPrevBlock == tip hash
 *   2. CheckTarget       : nBits decodes to 0 < target <= powLimit
 *   3. CheckProofOfWork  : hash (little-endian number) <= target
 *   4. CheckTimestamp    : nTime > median-time-past, and not too far past
 *                          the host's adjusted time when one is supplied
 *   5. CheckVersion      : BIP34/66/65 minimum versions
 * The first failing check decides the rejection.
 *
 * LAYER 2: Contextual difficulty (ContextualCheckBlockHeader)
 * nBits must equal GetNextWorkRequired() for the tip. Without this, a header
 * could carry valid work against an artificially easy target.
 *
 * INTEGRATION POINT:
 * - chain::ChainAccumulator::Apply() runs both layers before folding a
 *   header into the chain state.
 * ============================================================================
 */

/**
 * Classified failure reasons. Each rejection carries exactly one.
 */
enum class ValidationError {
  NONE,
  LINKAGE_MISMATCH,
  INVALID_TARGET,
  PROOF_OF_WORK_NOT_MET,
  TIMESTAMP_OUT_OF_RANGE,
  DIFFICULTY_MISMATCH,
  INCLUSION_PROOF_FAILED,
  PATH_TOO_LONG,
  ARITHMETIC_OVERFLOW,
  BAD_VERSION,
  MALFORMED_TRANSACTION,
  WITHDRAWAL_OUTPUT_MISSING,
  HEADER_INDEX_OUT_OF_RANGE,
  BATCH_TOO_LARGE,
};

// Stable upper-case name, e.g. "LINKAGE_MISMATCH"
const char *ValidationErrorToString(ValidationError error);

/**
 * Validation state - tracks why validation failed
 * Simplified from Bitcoin Core's BlockValidationState
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Consensus rule violated by the input
    ERROR    // Arithmetic fault while evaluating a rule
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(ValidationError error, const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    error_ = error;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(ValidationError error, const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    error_ = error;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  ValidationError GetError() const { return error_; }
  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  // "<ERROR_NAME>: <reject-reason> (<debug>)"
  std::string ToString() const;

private:
  Result result_;
  ValidationError error_{ValidationError::NONE};
  std::string reject_reason_;
  std::string debug_message_;
};

// Validation constants
static constexpr int64_t MAX_FUTURE_BLOCK_TIME = 2 * 60 * 60; // 2 hours

/**
 * Everything a header check may read. The checks never modify it.
 * adjusted_time is only present when the host supplies a clock reading.
 */
struct HeaderContext {
  const chain::ChainState &prev;
  const chain::ConsensusParams &params;
  std::optional<int64_t> adjusted_time;
};

// Values derived while checking, reused by the caller
struct CheckedHeader {
  uint256 hash;
  arith_uint256 target;
};

using HeaderCheckFn = bool (*)(const CBlockHeader &header,
                               const HeaderContext &ctx, CheckedHeader &out,
                               ValidationState &state);

struct HeaderCheck {
  const char *name;
  HeaderCheckFn fn;
};

bool CheckLinkage(const CBlockHeader &header, const HeaderContext &ctx,
                  CheckedHeader &out, ValidationState &state);
bool CheckTarget(const CBlockHeader &header, const HeaderContext &ctx,
                 CheckedHeader &out, ValidationState &state);
bool CheckProofOfWork(const CBlockHeader &header, const HeaderContext &ctx,
                      CheckedHeader &out, ValidationState &state);
bool CheckTimestamp(const CBlockHeader &header, const HeaderContext &ctx,
                    CheckedHeader &out, ValidationState &state);
bool CheckVersion(const CBlockHeader &header, const HeaderContext &ctx,
                  CheckedHeader &out, ValidationState &state);

// The checks CheckBlockHeader() runs, in order
const std::array<HeaderCheck, 5> &HeaderChecks();

// CONSENSUS-CRITICAL: runs HeaderChecks() in order, stopping at the first
// failure. On success `out` holds the header hash and decoded target.
bool CheckBlockHeader(const CBlockHeader &header, const HeaderContext &ctx,
                      CheckedHeader &out, ValidationState &state);

// CONSENSUS-CRITICAL: nBits must match the difficulty schedule
// (DIFFICULTY_MISMATCH otherwise)
bool ContextualCheckBlockHeader(const CBlockHeader &header,
                                const chain::ChainState &prev,
                                const chain::ConsensusParams &params,
                                ValidationState &state);

} // namespace validation
} // namespace spvproof
