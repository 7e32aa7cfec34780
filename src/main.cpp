// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "chain/validation.hpp"
#include "circuit/batch_json.hpp"
#include "circuit/circuit.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <iterator>
#include <string_view>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace {

// Exit codes
constexpr int EXIT_COMMITTED = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_REJECTED = 2;

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " --input=<file> [options]\n"
      << "\n"
      << "Folds a header batch onto its checkpoint, verifies inclusion and\n"
      << "withdrawal proofs, and prints the resulting commitment as JSON.\n"
      << "\n"
      << "Options:\n"
      << "  --input=<path>        JSON input batch (\"-\" reads stdin)\n"
      << "  --output=<path>       Write the commitment here instead of stdout\n"
      << "  --chain=<name>        main, signet or regtest (default: main)\n"
      << "  --signet              Same as --chain=signet\n"
      << "  --regtest             Same as --chain=regtest\n"
      << "  --max-headers=<n>     Most headers accepted in one batch (default: 20000)\n"
      << "  --finality-depth=<n>  Blocks below the tip reported as final (default: 4)\n"
      << "  --bridge-amount=<n>   Withdrawal output value in satoshis (default: 100000000)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>    Set global log level (trace,debug,info,warn,error,critical,off)\n"
      << "                        Default: warn\n"
      << "  --debug=<component>   Enable trace logging for specific component(s)\n"
      << "                        Components: chain, crypto, circuit, app, all\n"
      << "                        Can be comma-separated: --debug=chain,circuit\n"
      << "  --logfile=<path>      Log to a rotating file instead of stderr\n"
      << "\n"
      << "Other:\n"
      << "  --version             Show version information\n"
      << "  --help                Show this help message\n"
      << "\n"
      << "Exit status: 0 commitment produced, 2 batch rejected, 1 usage or input error\n"
      << std::endl;
}

std::optional<std::string> read_input(const std::string &path) {
  if (path == "-") {
    std::string data((std::istreambuf_iterator<char>(std::cin)),
                     std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
      return std::nullopt;
    }
    return data;
  }
  return spvproof::util::read_file_string(path);
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace spvproof;

  try {
    std::string input_path;
    std::string output_path;
    chain::ChainType chain_type = chain::ChainType::MAIN;
    std::optional<uint32_t> max_headers;
    std::optional<uint32_t> finality_depth;
    std::optional<int64_t> bridge_amount;
    std::string log_level = "warn";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return EXIT_COMMITTED;
      } else if (arg == "--version") {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << GetCopyrightString() << std::endl;
        return EXIT_COMMITTED;
      } else if (arg.find("--input=") == 0) {
        input_path = arg.substr(8);
      } else if (arg.find("--output=") == 0) {
        output_path = arg.substr(9);
      } else if (arg.find("--chain=") == 0) {
        auto type = chain::ChainTypeFromString(arg.substr(8));
        if (!type) {
          std::cerr << "Error: Unknown chain: " << arg.substr(8) << std::endl;
          std::cerr << "Chain must be one of main, signet, regtest" << std::endl;
          return EXIT_USAGE;
        }
        chain_type = *type;
      } else if (arg == "--signet") {
        chain_type = chain::ChainType::SIGNET;
      } else if (arg == "--regtest") {
        chain_type = chain::ChainType::REGTEST;
      } else if (arg.find("--max-headers=") == 0) {
        auto n = util::SafeParseInt64(arg.substr(14), 1,
                                      std::numeric_limits<uint32_t>::max());
        if (!n) {
          std::cerr << "Error: Invalid header limit: " << arg.substr(14) << std::endl;
          return EXIT_USAGE;
        }
        max_headers = static_cast<uint32_t>(*n);
      } else if (arg.find("--finality-depth=") == 0) {
        auto n = util::SafeParseInt64(arg.substr(17), 0,
                                      std::numeric_limits<uint32_t>::max());
        if (!n) {
          std::cerr << "Error: Invalid finality depth: " << arg.substr(17) << std::endl;
          return EXIT_USAGE;
        }
        finality_depth = static_cast<uint32_t>(*n);
      } else if (arg.find("--bridge-amount=") == 0) {
        auto n = util::SafeParseInt64(arg.substr(16), 1,
                                      std::numeric_limits<int64_t>::max());
        if (!n) {
          std::cerr << "Error: Invalid bridge amount: " << arg.substr(16) << std::endl;
          return EXIT_USAGE;
        }
        bridge_amount = *n;
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=chain,circuit
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return EXIT_USAGE;
      }
    }

    if (input_path.empty()) {
      std::cerr << "Error: --input is required" << std::endl;
      print_usage(argv[0]);
      return EXIT_USAGE;
    }

    util::LogManager::Initialize(log_level, !log_file.empty(), log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        util::LogManager::SetLogLevel("trace");
      } else if (!util::LogManager::SetComponentLevel(component, "trace")) {
        std::cerr << "WARNING: unknown log component '" << component << "'"
                  << std::endl;
      }
    }

    auto params = chain::ChainParams::Create(chain_type);
    if (max_headers) {
      params->SetMaxHeadersPerBatch(*max_headers);
    }
    if (finality_depth) {
      params->SetFinalityDepth(*finality_depth);
    }
    if (bridge_amount) {
      params->SetBridgeAmount(*bridge_amount);
    }

    auto text = read_input(input_path);
    if (!text) {
      std::cerr << "Error: Cannot read input batch: " << input_path << std::endl;
      util::LogManager::Shutdown();
      return EXIT_USAGE;
    }

    circuit::InputBatch batch;
    try {
      batch = circuit::ParseInputBatch(std::string_view(*text));
    } catch (const circuit::BatchFormatError &e) {
      std::cerr << "Error: Malformed input batch: " << e.what() << std::endl;
      util::LogManager::Shutdown();
      return EXIT_USAGE;
    }

    LOG_APP_INFO("Running {} batch: checkpoint height {}, {} headers, {} inclusions, {} withdrawals",
                 params->GetChainTypeString(), batch.checkpoint.height,
                 batch.headers.size(), batch.inclusions.size(),
                 batch.withdrawals.size());

    validation::ValidationState state;
    auto commitment = circuit::RunCircuit(batch, params->GetConsensus(), state);
    if (!commitment) {
      LOG_APP_ERROR("Batch rejected: {}", state.ToString());
      std::cerr << "Rejected: " << state.ToString() << std::endl;
      util::LogManager::Shutdown();
      return EXIT_REJECTED;
    }

    const std::string out = circuit::CommitmentToJson(*commitment).dump(2) + "\n";
    if (output_path.empty()) {
      std::cout << out;
    } else if (!util::atomic_write_file(output_path, out)) {
      std::cerr << "Error: Cannot write commitment to " << output_path << std::endl;
      util::LogManager::Shutdown();
      return EXIT_USAGE;
    }

    LOG_APP_INFO("Commitment {} at height {}", commitment->GetHash().GetHex(),
                 commitment->finalState.height);
    util::LogManager::Shutdown();
    return EXIT_COMMITTED;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    spvproof::util::LogManager::Shutdown();
    return EXIT_USAGE;
  }
}
