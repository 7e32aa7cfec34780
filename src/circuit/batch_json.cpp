// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "circuit/batch_json.hpp"
#include "util/string_parsing.hpp"
#include <cstdio>
#include <limits>

namespace spvproof {
namespace circuit {

using json = nlohmann::json;

namespace {

[[noreturn]] void Fail(const std::string &where, const std::string &what) {
  throw BatchFormatError(where + ": " + what);
}

const json &Require(const json &j, const char *key, const std::string &where) {
  if (!j.is_object()) {
    Fail(where, "expected an object");
  }
  auto it = j.find(key);
  if (it == j.end()) {
    Fail(where, std::string("missing field '") + key + "'");
  }
  return *it;
}

uint64_t ParseUInt(const json &v, const std::string &where,
                   uint64_t max = std::numeric_limits<uint64_t>::max()) {
  if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
    Fail(where, "expected a non-negative integer");
  }
  const uint64_t value = v.get<uint64_t>();
  if (value > max) {
    Fail(where, "value " + std::to_string(value) + " out of range");
  }
  return value;
}

std::string ParseString(const json &v, const std::string &where) {
  if (!v.is_string()) {
    Fail(where, "expected a string");
  }
  return v.get<std::string>();
}

uint256 ParseHash(const json &v, const std::string &where) {
  auto hash = util::SafeParseHash(ParseString(v, where));
  if (!hash) {
    Fail(where, "expected 64 hex digits");
  }
  return *hash;
}

std::vector<uint8_t> ParseBytes(const json &v, const std::string &where) {
  auto bytes = util::ParseHexBytes(ParseString(v, where));
  if (!bytes) {
    Fail(where, "expected an even number of hex digits");
  }
  return *bytes;
}

uint32_t ParseBits(const json &v, const std::string &where) {
  if (v.is_string()) {
    std::string s = v.get<std::string>();
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
      s = s.substr(2);
    }
    auto bytes = util::ParseHexBytes(s);
    if (!bytes || bytes->size() != 4) {
      Fail(where, "expected 8 hex digits");
    }
    return (uint32_t{(*bytes)[0]} << 24) | (uint32_t{(*bytes)[1]} << 16) |
           (uint32_t{(*bytes)[2]} << 8) | uint32_t{(*bytes)[3]};
  }
  return static_cast<uint32_t>(
      ParseUInt(v, where, std::numeric_limits<uint32_t>::max()));
}

arith_uint256 ParseWork(const json &v, const std::string &where) {
  std::string s = ParseString(v, where);
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    s = s.substr(2);
  }
  if (!util::IsValidHex(s) || s.size() > 64) {
    Fail(where, "expected at most 64 hex digits");
  }
  return UintToArith256(uint256S(s));
}

std::string FormatBits(uint32_t bits) {
  char buf[9];
  std::snprintf(buf, sizeof(buf), "%08x", bits);
  return buf;
}

CBlockHeader ParseHeader(const json &v, const std::string &where) {
  CBlockHeader header;
  if (v.is_string()) {
    auto bytes = ParseBytes(v, where);
    if (!header.Deserialize(bytes)) {
      Fail(where, "serialized header must be " +
                      std::to_string(CBlockHeader::HEADER_SIZE) + " bytes, got " +
                      std::to_string(bytes.size()));
    }
    return header;
  }
  const json &version = Require(v, "version", where);
  if (!version.is_number_integer()) {
    Fail(where + ".version", "expected an integer");
  }
  const int64_t nVersion = version.get<int64_t>();
  if (nVersion < std::numeric_limits<int32_t>::min() ||
      nVersion > std::numeric_limits<int32_t>::max()) {
    Fail(where + ".version", "out of range");
  }
  header.nVersion = static_cast<int32_t>(nVersion);
  header.hashPrevBlock = ParseHash(Require(v, "prev_block", where), where + ".prev_block");
  header.hashMerkleRoot = ParseHash(Require(v, "merkle_root", where), where + ".merkle_root");
  header.nTime = static_cast<uint32_t>(ParseUInt(
      Require(v, "time", where), where + ".time", std::numeric_limits<uint32_t>::max()));
  header.nBits = ParseBits(Require(v, "bits", where), where + ".bits");
  header.nNonce = static_cast<uint32_t>(ParseUInt(
      Require(v, "nonce", where), where + ".nonce", std::numeric_limits<uint32_t>::max()));
  return header;
}

chain::MerklePath ParsePath(const json &v, const std::string &where) {
  if (v.is_array()) {
    chain::MerklePath path;
    for (size_t i = 0; i < v.size(); ++i) {
      const std::string at = where + "[" + std::to_string(i) + "]";
      const uint256 sibling = ParseHash(Require(v[i], "hash", at), at + ".hash");
      const std::string side = ParseString(Require(v[i], "side", at), at + ".side");
      if (side == "left") {
        path.Append(sibling, chain::MerkleSide::LEFT);
      } else if (side == "right") {
        path.Append(sibling, chain::MerkleSide::RIGHT);
      } else {
        Fail(at + ".side", "expected \"left\" or \"right\"");
      }
    }
    return path;
  }
  if (v.is_object()) {
    const json &branch_json = Require(v, "branch", where);
    if (!branch_json.is_array()) {
      Fail(where + ".branch", "expected an array");
    }
    std::vector<uint256> branch;
    for (size_t i = 0; i < branch_json.size(); ++i) {
      branch.push_back(ParseHash(branch_json[i], where + ".branch[" +
                                                     std::to_string(i) + "]"));
    }
    const auto index = static_cast<uint32_t>(ParseUInt(
        Require(v, "index", where), where + ".index",
        std::numeric_limits<uint32_t>::max()));
    auto path = chain::MerklePath::FromIndex(branch, index);
    if (!path) {
      Fail(where + ".index", "index does not fit a branch of " +
                                 std::to_string(branch.size()));
    }
    return *path;
  }
  Fail(where, "expected an array of steps or a {branch, index} object");
}

json PathToJson(const chain::MerklePath &path) {
  json steps = json::array();
  for (const auto &step : path.Steps()) {
    steps.push_back({{"hash", step.sibling.GetHex()},
                     {"side", step.side == chain::MerkleSide::LEFT ? "left" : "right"}});
  }
  return steps;
}

chain::ChainState ParseCheckpoint(const json &v) {
  const std::string where = "checkpoint";
  chain::ChainState state;
  state.tipHash = ParseHash(Require(v, "tip_hash", where), where + ".tip_hash");
  state.height = static_cast<int32_t>(ParseUInt(
      Require(v, "height", where), where + ".height",
      std::numeric_limits<int32_t>::max()));
  state.chainWork = ParseWork(Require(v, "chain_work", where), where + ".chain_work");
  state.tipBits = ParseBits(Require(v, "bits", where), where + ".bits");
  state.tipTime = static_cast<uint32_t>(ParseUInt(
      Require(v, "time", where), where + ".time",
      std::numeric_limits<uint32_t>::max()));
  state.periodStartTime = static_cast<uint32_t>(ParseUInt(
      Require(v, "period_start_time", where), where + ".period_start_time",
      std::numeric_limits<uint32_t>::max()));

  const json &times = Require(v, "recent_times", where);
  if (!times.is_array() || times.size() > static_cast<size_t>(chain::MEDIAN_TIME_SPAN)) {
    Fail(where + ".recent_times", "expected an array of at most " +
                                      std::to_string(chain::MEDIAN_TIME_SPAN) +
                                      " timestamps");
  }
  for (size_t i = 0; i < times.size(); ++i) {
    state.recentTimes.push_back(static_cast<uint32_t>(ParseUInt(
        times[i], where + ".recent_times[" + std::to_string(i) + "]",
        std::numeric_limits<uint32_t>::max())));
  }
  return state;
}

const json &OptionalArray(const json &j, const char *key) {
  static const json empty = json::array();
  auto it = j.find(key);
  if (it == j.end()) {
    return empty;
  }
  if (!it->is_array()) {
    Fail(key, "expected an array");
  }
  return *it;
}

} // namespace

InputBatch ParseInputBatch(const json &j) {
  if (!j.is_object()) {
    Fail("batch", "expected an object");
  }

  InputBatch batch;
  batch.checkpoint = ParseCheckpoint(Require(j, "checkpoint", "batch"));

  const json &headers = OptionalArray(j, "headers");
  batch.headers.reserve(headers.size());
  for (size_t i = 0; i < headers.size(); ++i) {
    batch.headers.push_back(
        ParseHeader(headers[i], "headers[" + std::to_string(i) + "]"));
  }

  const json &inclusions = OptionalArray(j, "inclusions");
  for (size_t i = 0; i < inclusions.size(); ++i) {
    const std::string at = "inclusions[" + std::to_string(i) + "]";
    const json &v = inclusions[i];
    InclusionRequest request;
    request.requestId = ParseUInt(Require(v, "request_id", at), at + ".request_id");
    request.headerIndex = static_cast<uint32_t>(ParseUInt(
        Require(v, "header_index", at), at + ".header_index",
        std::numeric_limits<uint32_t>::max()));

    const bool has_tx = v.contains("tx");
    const bool has_leaf = v.contains("leaf");
    if (has_tx == has_leaf) {
      Fail(at, "exactly one of 'tx' or 'leaf' is required");
    }
    if (has_tx) {
      request.leaf = ParseBytes(v["tx"], at + ".tx");
    } else {
      request.leaf = ParseHash(v["leaf"], at + ".leaf");
    }
    if (v.contains("path")) {
      request.path = ParsePath(v["path"], at + ".path");
    }
    batch.inclusions.push_back(std::move(request));
  }

  const json &withdrawals = OptionalArray(j, "withdrawals");
  for (size_t i = 0; i < withdrawals.size(); ++i) {
    const std::string at = "withdrawals[" + std::to_string(i) + "]";
    const json &v = withdrawals[i];
    WithdrawalProof proof;
    auto key = uint256::FromRawHex(
        ParseString(Require(v, "output_key", at), at + ".output_key"));
    if (!key) {
      Fail(at + ".output_key", "expected 64 hex digits");
    }
    proof.outputKey = *key;
    proof.rawTx = ParseBytes(Require(v, "tx", at), at + ".tx");
    proof.headerIndex = static_cast<uint32_t>(ParseUInt(
        Require(v, "header_index", at), at + ".header_index",
        std::numeric_limits<uint32_t>::max()));
    if (v.contains("path")) {
      proof.path = ParsePath(v["path"], at + ".path");
    }
    batch.withdrawals.push_back(std::move(proof));
  }

  if (j.contains("adjusted_time")) {
    const json &t = j["adjusted_time"];
    if (!t.is_number_integer()) {
      Fail("adjusted_time", "expected an integer");
    }
    batch.adjustedTime = t.get<int64_t>();
  }
  return batch;
}

InputBatch ParseInputBatch(std::string_view text) {
  json j;
  try {
    j = json::parse(text.begin(), text.end());
  } catch (const json::parse_error &e) {
    throw BatchFormatError(std::string("invalid JSON: ") + e.what());
  }
  return ParseInputBatch(j);
}

json InputBatchToJson(const InputBatch &batch) {
  const auto &cp = batch.checkpoint;
  json j;
  j["checkpoint"] = {
      {"tip_hash", cp.tipHash.GetHex()},
      {"height", cp.height},
      {"chain_work", cp.chainWork.GetHex()},
      {"bits", FormatBits(cp.tipBits)},
      {"time", cp.tipTime},
      {"period_start_time", cp.periodStartTime},
      {"recent_times", cp.recentTimes},
  };

  json headers = json::array();
  for (const auto &header : batch.headers) {
    headers.push_back(util::HexStr(header.Serialize()));
  }
  j["headers"] = headers;

  json inclusions = json::array();
  for (const auto &request : batch.inclusions) {
    json r = {{"request_id", request.requestId},
              {"header_index", request.headerIndex},
              {"path", PathToJson(request.path)}};
    if (const auto *digest = std::get_if<uint256>(&request.leaf)) {
      r["leaf"] = digest->GetHex();
    } else {
      r["tx"] = util::HexStr(std::get<std::vector<uint8_t>>(request.leaf));
    }
    inclusions.push_back(r);
  }
  j["inclusions"] = inclusions;

  json withdrawals = json::array();
  for (const auto &proof : batch.withdrawals) {
    withdrawals.push_back({{"output_key", proof.outputKey.GetRawHex()},
                           {"tx", util::HexStr(proof.rawTx)},
                           {"header_index", proof.headerIndex},
                           {"path", PathToJson(proof.path)}});
  }
  j["withdrawals"] = withdrawals;

  if (batch.adjustedTime) {
    j["adjusted_time"] = *batch.adjustedTime;
  }
  return j;
}

json CommitmentToJson(const Commitment &commitment) {
  json results = json::array();
  for (const auto &r : commitment.inclusionResults) {
    results.push_back({{"request_id", r.requestId}, {"verified", r.verified}});
  }
  return {
      {"tip_hash", commitment.finalState.tipHash.GetHex()},
      {"height", commitment.finalState.height},
      {"chain_work", commitment.finalState.chainWork.GetHex()},
      {"finalized_hash", commitment.finalizedHash.GetHex()},
      {"block_hashes_root", commitment.blockHashesRoot.GetHex()},
      {"block_hash_count", commitment.blockHashCount},
      {"withdrawals_root", commitment.withdrawalsRoot.GetHex()},
      {"withdrawal_count", commitment.withdrawalCount},
      {"inclusions", results},
      {"commitment_hash", commitment.GetHash().GetHex()},
  };
}

} // namespace circuit
} // namespace spvproof
