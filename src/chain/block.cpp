// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/block.hpp"
#include "chain/endian.hpp"
#include "crypto/sha256.hpp"
#include <algorithm>
#include <sstream>

uint256 CBlockHeader::GetHash() const {
  const auto s = SerializeFixed();
  return spvproof::crypto::Hash(std::span<const unsigned char>(s.data(), s.size()));
}

CBlockHeader::HeaderBytes CBlockHeader::SerializeFixed() const noexcept {
  HeaderBytes data{};

  // nVersion (4 bytes, offset 0)
  endian::WriteLE32(data.data() + OFF_VERSION, static_cast<uint32_t>(nVersion));

  // hashPrevBlock (32 bytes, offset 4)
  std::copy(hashPrevBlock.begin(), hashPrevBlock.end(), data.begin() + OFF_PREV);

  // hashMerkleRoot (32 bytes, offset 36)
  std::copy(hashMerkleRoot.begin(), hashMerkleRoot.end(), data.begin() + OFF_MERKLE);

  // nTime (4 bytes, offset 68)
  endian::WriteLE32(data.data() + OFF_TIME, nTime);

  // nBits (4 bytes, offset 72)
  endian::WriteLE32(data.data() + OFF_BITS, nBits);

  // nNonce (4 bytes, offset 76)
  endian::WriteLE32(data.data() + OFF_NONCE, nNonce);

  return data;
}

std::vector<uint8_t> CBlockHeader::Serialize() const {
  auto arr = SerializeFixed();
  return std::vector<uint8_t>(arr.begin(), arr.end());
}

bool CBlockHeader::Deserialize(const uint8_t *data, size_t size) noexcept {
  if (data == nullptr || size != HEADER_SIZE) {
    return false;
  }

  nVersion = static_cast<int32_t>(endian::ReadLE32(data + OFF_VERSION));
  std::copy(data + OFF_PREV, data + OFF_PREV + UINT256_BYTES,
            hashPrevBlock.begin());
  std::copy(data + OFF_MERKLE, data + OFF_MERKLE + UINT256_BYTES,
            hashMerkleRoot.begin());
  nTime = endian::ReadLE32(data + OFF_TIME);
  nBits = endian::ReadLE32(data + OFF_BITS);
  nNonce = endian::ReadLE32(data + OFF_NONCE);

  return true;
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader(\n";
  s << "  version=" << nVersion << "\n";
  s << "  hashPrevBlock=" << hashPrevBlock.GetHex() << "\n";
  s << "  hashMerkleRoot=" << hashMerkleRoot.GetHex() << "\n";
  s << "  nTime=" << nTime << "\n";
  s << "  nBits=0x" << std::hex << nBits << std::dec << "\n";
  s << "  nNonce=" << nNonce << "\n";
  s << "  hash=" << GetHash().GetHex() << "\n";
  s << ")\n";
  return s.str();
}
