// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/transaction.hpp"
#include "chain/endian.hpp"
#include "crypto/sha256.hpp"
#include <algorithm>

namespace spvproof {
namespace chain {

namespace {

// Bounds-checked cursor over the input. Every read fails cleanly instead of
// running past the end.
class ByteReader {
public:
  explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

  size_t Remaining() const { return data_.size() - pos_; }

  bool ReadU8(uint8_t &v) {
    if (Remaining() < 1) return false;
    v = data_[pos_++];
    return true;
  }

  bool PeekU8(uint8_t &v) const {
    if (Remaining() < 1) return false;
    v = data_[pos_];
    return true;
  }

  bool ReadLE32(uint32_t &v) {
    if (Remaining() < 4) return false;
    v = endian::ReadLE32(data_.data() + pos_);
    pos_ += 4;
    return true;
  }

  bool ReadLE64(uint64_t &v) {
    if (Remaining() < 8) return false;
    v = endian::ReadLE64(data_.data() + pos_);
    pos_ += 8;
    return true;
  }

  bool ReadHash(uint256 &v) {
    if (Remaining() < uint256::size()) return false;
    std::copy_n(data_.data() + pos_, uint256::size(), v.begin());
    pos_ += uint256::size();
    return true;
  }

  bool ReadBytes(std::vector<uint8_t> &v, size_t n) {
    if (Remaining() < n) return false;
    v.assign(data_.begin() + pos_, data_.begin() + pos_ + n);
    pos_ += n;
    return true;
  }

  // Canonical CompactSize only: each value has exactly one encoding
  bool ReadCompactSize(uint64_t &n, std::string &error) {
    uint8_t prefix;
    if (!ReadU8(prefix)) {
      error = "truncated compact size";
      return false;
    }
    if (prefix < 253) {
      n = prefix;
    } else if (prefix == 253) {
      if (Remaining() < 2) {
        error = "truncated compact size";
        return false;
      }
      n = endian::ReadLE16(data_.data() + pos_);
      pos_ += 2;
      if (n < 253) {
        error = "non-canonical compact size";
        return false;
      }
    } else if (prefix == 254) {
      uint32_t v;
      if (!ReadLE32(v)) {
        error = "truncated compact size";
        return false;
      }
      n = v;
      if (n < 0x10000u) {
        error = "non-canonical compact size";
        return false;
      }
    } else {
      if (!ReadLE64(n)) {
        error = "truncated compact size";
        return false;
      }
      if (n < 0x100000000ULL) {
        error = "non-canonical compact size";
        return false;
      }
    }
    if (n > MAX_COMPACT_SIZE) {
      error = "compact size too large";
      return false;
    }
    return true;
  }

  // Length prefix for a run of items that each take at least min_item bytes
  bool ReadCount(uint64_t &n, size_t min_item, const char *what,
                 std::string &error) {
    if (!ReadCompactSize(n, error)) {
      return false;
    }
    if (min_item > 0 && n > Remaining() / min_item) {
      error = std::string(what) + " count exceeds remaining input";
      return false;
    }
    return true;
  }

  bool ReadVarBytes(std::vector<uint8_t> &v, const char *what,
                    std::string &error) {
    uint64_t n;
    if (!ReadCount(n, 1, what, error)) {
      return false;
    }
    return ReadBytes(v, static_cast<size_t>(n));
  }

private:
  std::span<const uint8_t> data_;
  size_t pos_{0};
};

void WriteLE32(std::vector<uint8_t> &out, uint32_t v) {
  uint8_t buf[4];
  endian::WriteLE32(buf, v);
  out.insert(out.end(), buf, buf + 4);
}

void WriteLE64(std::vector<uint8_t> &out, uint64_t v) {
  uint8_t buf[8];
  endian::WriteLE64(buf, v);
  out.insert(out.end(), buf, buf + 8);
}

void WriteVarBytes(std::vector<uint8_t> &out, const std::vector<uint8_t> &v) {
  WriteCompactSize(out, v.size());
  out.insert(out.end(), v.begin(), v.end());
}

// Smallest encodings: outpoint(36) + script len(1) + sequence(4)
constexpr size_t MIN_TXIN_SIZE = 41;
// value(8) + script len(1)
constexpr size_t MIN_TXOUT_SIZE = 9;

} // namespace

void WriteCompactSize(std::vector<uint8_t> &out, uint64_t n) {
  if (n < 253) {
    out.push_back(static_cast<uint8_t>(n));
  } else if (n <= 0xffff) {
    out.push_back(253);
    uint8_t buf[2];
    endian::WriteLE16(buf, static_cast<uint16_t>(n));
    out.insert(out.end(), buf, buf + 2);
  } else if (n <= 0xffffffffULL) {
    out.push_back(254);
    WriteLE32(out, static_cast<uint32_t>(n));
  } else {
    out.push_back(255);
    WriteLE64(out, n);
  }
}

std::vector<uint8_t> TaprootScript(const uint256 &outputKey) {
  std::vector<uint8_t> script;
  script.reserve(TAPROOT_SCRIPT_SIZE);
  script.push_back(OP_1);
  script.push_back(static_cast<uint8_t>(uint256::size()));
  script.insert(script.end(), outputKey.begin(), outputKey.end());
  return script;
}

bool CTxOut::IsTaprootTo(const uint256 &outputKey) const {
  return scriptPubKey.size() == TAPROOT_SCRIPT_SIZE &&
         scriptPubKey[0] == OP_1 && scriptPubKey[1] == uint256::size() &&
         std::equal(outputKey.begin(), outputKey.end(),
                    scriptPubKey.begin() + 2);
}

bool CTransaction::Deserialize(std::span<const uint8_t> bytes,
                               std::string &error) {
  if (bytes.size() > MAX_TX_SIZE) {
    error = "transaction larger than " + std::to_string(MAX_TX_SIZE) + " bytes";
    return false;
  }

  ByteReader reader(bytes);
  vin.clear();
  vout.clear();

  uint32_t version;
  if (!reader.ReadLE32(version)) {
    error = "truncated version";
    return false;
  }
  nVersion = static_cast<int32_t>(version);

  // BIP144: a zero byte where the input count belongs is the segwit marker
  bool segwit = false;
  uint8_t marker;
  if (reader.PeekU8(marker) && marker == 0x00) {
    uint8_t flag;
    if (!reader.ReadU8(marker) || !reader.ReadU8(flag)) {
      error = "truncated segwit flag";
      return false;
    }
    if (flag != 0x01) {
      error = "unknown segwit flag";
      return false;
    }
    segwit = true;
  }

  uint64_t n_in;
  if (!reader.ReadCount(n_in, MIN_TXIN_SIZE, "input", error)) {
    return false;
  }
  if (n_in == 0) {
    error = "transaction has no inputs";
    return false;
  }
  vin.resize(static_cast<size_t>(n_in));
  for (auto &in : vin) {
    if (!reader.ReadHash(in.prevout.hash) || !reader.ReadLE32(in.prevout.n)) {
      error = "truncated outpoint";
      return false;
    }
    if (!reader.ReadVarBytes(in.scriptSig, "scriptSig", error)) {
      if (error.empty()) error = "truncated scriptSig";
      return false;
    }
    if (!reader.ReadLE32(in.nSequence)) {
      error = "truncated sequence";
      return false;
    }
  }

  uint64_t n_out;
  if (!reader.ReadCount(n_out, MIN_TXOUT_SIZE, "output", error)) {
    return false;
  }
  vout.resize(static_cast<size_t>(n_out));
  for (auto &out : vout) {
    uint64_t value;
    if (!reader.ReadLE64(value)) {
      error = "truncated output value";
      return false;
    }
    out.nValue = static_cast<int64_t>(value);
    if (!reader.ReadVarBytes(out.scriptPubKey, "scriptPubKey", error)) {
      if (error.empty()) error = "truncated scriptPubKey";
      return false;
    }
  }

  if (segwit) {
    for (auto &in : vin) {
      uint64_t n_items;
      if (!reader.ReadCount(n_items, 1, "witness item", error)) {
        return false;
      }
      in.witness.resize(static_cast<size_t>(n_items));
      for (auto &item : in.witness) {
        if (!reader.ReadVarBytes(item, "witness item", error)) {
          if (error.empty()) error = "truncated witness item";
          return false;
        }
      }
    }
    if (!HasWitness()) {
      error = "superfluous witness record";
      return false;
    }
  }

  if (!reader.ReadLE32(nLockTime)) {
    error = "truncated lock time";
    return false;
  }
  if (reader.Remaining() != 0) {
    error = std::to_string(reader.Remaining()) + " trailing bytes";
    return false;
  }
  if (Serialize(false).size() == MERKLE_NODE_TX_SIZE) {
    error = "stripped size of " + std::to_string(MERKLE_NODE_TX_SIZE) +
            " bytes";
    return false;
  }
  return true;
}

std::vector<uint8_t> CTransaction::Serialize(bool with_witness) const {
  const bool segwit = with_witness && HasWitness();
  std::vector<uint8_t> out;
  WriteLE32(out, static_cast<uint32_t>(nVersion));
  if (segwit) {
    out.push_back(0x00);
    out.push_back(0x01);
  }
  WriteCompactSize(out, vin.size());
  for (const auto &in : vin) {
    out.insert(out.end(), in.prevout.hash.begin(), in.prevout.hash.end());
    WriteLE32(out, in.prevout.n);
    WriteVarBytes(out, in.scriptSig);
    WriteLE32(out, in.nSequence);
  }
  WriteCompactSize(out, vout.size());
  for (const auto &o : vout) {
    WriteLE64(out, static_cast<uint64_t>(o.nValue));
    WriteVarBytes(out, o.scriptPubKey);
  }
  if (segwit) {
    for (const auto &in : vin) {
      WriteCompactSize(out, in.witness.size());
      for (const auto &item : in.witness) {
        WriteVarBytes(out, item);
      }
    }
  }
  WriteLE32(out, nLockTime);
  return out;
}

bool CTransaction::HasWitness() const {
  return std::any_of(vin.begin(), vin.end(),
                     [](const CTxIn &in) { return !in.witness.empty(); });
}

uint256 CTransaction::GetTxid() const {
  const auto bytes = Serialize(false);
  return crypto::Hash(std::span<const unsigned char>(bytes.data(), bytes.size()));
}

bool CTransaction::PaysTaproot(int64_t amount, const uint256 &outputKey) const {
  return std::any_of(vout.begin(), vout.end(), [&](const CTxOut &out) {
    return out.nValue == amount && out.IsTaprootTo(outputKey);
  });
}

} // namespace chain
} // namespace spvproof
