// Copyright (c) 2025 The Unicity Foundation
// Regtest Batch Builder - mines a short regtest chain and writes an input
// batch for spvproof-run with one inclusion request and one withdrawal

#include "chain/chain_accumulator.hpp"
#include "chain/endian.hpp"
#include "chain/chain_state.hpp"
#include "chain/chainparams.hpp"
#include "chain/merkle.hpp"
#include "chain/miner.hpp"
#include "chain/transaction.hpp"
#include "circuit/batch_json.hpp"
#include "crypto/sha256.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace spvproof;

namespace {

// Single input spending a synthetic outpoint; `tag` keeps txids distinct
chain::CTransaction MakeTransaction(uint32_t tag, int64_t value,
                                    std::vector<uint8_t> script) {
  chain::CTransaction tx;
  chain::CTxIn in;
  unsigned char buf[4];
  endian::WriteLE32(buf, tag);
  in.prevout.hash = crypto::Sha256(buf);
  in.prevout.n = tag;
  in.scriptSig = {0x51};
  tx.vin.push_back(in);
  chain::CTxOut out;
  out.nValue = value;
  out.scriptPubKey = std::move(script);
  tx.vout.push_back(out);
  return tx;
}

// P2WPKH-shaped output script: OP_0 PUSH20 <20-byte program>
std::vector<uint8_t> WitnessV0Script(uint8_t fill) {
  std::vector<uint8_t> script = {0x00, 0x14};
  script.insert(script.end(), 20, fill);
  return script;
}

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [options]\n"
            << "\n"
            << "Options:\n"
            << "  --headers=<n>       Headers to mine on top of genesis (default: 6)\n"
            << "  --output-key=<hex>  Withdrawal taproot key, 64 hex digits in script order\n"
            << "  --output=<path>     Write the batch here instead of stdout\n"
            << "  --help              Show this help message\n"
            << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  int n_headers = 6;
  std::string output_path;
  uint256 output_key = *uint256::FromRawHex(
      "a60869f0dbcf1dc659c9cecbaf8050135ea9e8cdc487053f1dc6880949dc684c");

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (arg.find("--headers=") == 0) {
      auto n = util::SafeParseInt(arg.substr(10), 1, 2000);
      if (!n) {
        std::cerr << "Error: Invalid header count: " << arg.substr(10) << std::endl;
        return 1;
      }
      n_headers = *n;
    } else if (arg.find("--output-key=") == 0) {
      auto key = uint256::FromRawHex(arg.substr(13));
      if (!key) {
        std::cerr << "Error: Invalid output key: " << arg.substr(13) << std::endl;
        return 1;
      }
      output_key = *key;
    } else if (arg.find("--output=") == 0) {
      output_path = arg.substr(9);
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  util::LogManager::Initialize("warn");

  try {
    const auto params = chain::ChainParams::CreateRegTest();
    const auto &consensus = params->GetConsensus();

    circuit::InputBatch batch;
    batch.checkpoint = chain::ChainState::FromGenesis(*params);
    chain::ChainAccumulator accumulator(batch.checkpoint, consensus);

    // Every block holds a filler and a bridge payout; the last block is proven
    const int64_t amount = consensus.nBridgeAmountSats;
    std::vector<chain::CTransaction> last_block_txs;
    for (int h = 0; h < n_headers; ++h) {
      std::vector<chain::CTransaction> txs = {
          MakeTransaction(static_cast<uint32_t>(2 * h), 5000,
                          WitnessV0Script(static_cast<uint8_t>(h))),
          MakeTransaction(static_cast<uint32_t>(2 * h + 1), amount,
                          chain::TaprootScript(output_key)),
      };
      std::vector<uint256> txids;
      for (const auto &tx : txs) {
        txids.push_back(tx.GetTxid());
      }

      const auto &tip = accumulator.GetState();
      auto tmpl = mining::CreateBlockTemplate(tip, consensus,
                                              chain::ComputeMerkleRoot(txids),
                                              tip.tipTime + 600);
      if (!mining::MineHeader(tmpl.header, consensus)) {
        std::cerr << "Error: nonce space exhausted at height " << tmpl.nHeight
                  << std::endl;
        return 1;
      }
      validation::ValidationState state;
      if (!accumulator.Apply(tmpl.header, state)) {
        std::cerr << "Error: mined header rejected: " << state.ToString()
                  << std::endl;
        return 1;
      }
      batch.headers.push_back(tmpl.header);
      last_block_txs = std::move(txs);
    }

    std::vector<uint256> txids;
    for (const auto &tx : last_block_txs) {
      txids.push_back(tx.GetTxid());
    }
    const uint32_t last = static_cast<uint32_t>(batch.headers.size() - 1);

    circuit::InclusionRequest request;
    request.requestId = 1;
    request.headerIndex = last;
    request.leaf = last_block_txs[0].Serialize();
    request.path = *chain::ComputeMerklePath(txids, 0);
    batch.inclusions.push_back(request);

    circuit::WithdrawalProof proof;
    proof.outputKey = output_key;
    proof.rawTx = last_block_txs[1].Serialize();
    proof.headerIndex = last;
    proof.path = *chain::ComputeMerklePath(txids, 1);
    batch.withdrawals.push_back(proof);

    const std::string out = circuit::InputBatchToJson(batch).dump(2) + "\n";
    if (output_path.empty()) {
      std::cout << out;
    } else if (!util::atomic_write_file(output_path, out)) {
      std::cerr << "Error: Cannot write batch to " << output_path << std::endl;
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    util::LogManager::Shutdown();
    return 1;
  }

  util::LogManager::Shutdown();
  return 0;
}
