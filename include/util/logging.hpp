// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace spvproof {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "chain", "crypto", "circuit", "app"),
 * all sharing the same sinks. Consensus code only logs; it never reads the
 * log level or branches on logging.
 *
 * Thread-safety: initialization happens once via std::call_once; logger
 * lookup is mutex protected.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stderr
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "spvproof.log");

  /** Flush and drop all loggers. */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (chain, crypto, circuit, app, default)
   *
   * Auto-initializes if needed. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /** Set log level at runtime (all components) */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace spvproof

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  spvproof::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  spvproof::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  spvproof::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  spvproof::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  spvproof::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  spvproof::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  spvproof::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  spvproof::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  spvproof::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  spvproof::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_CIRCUIT_TRACE(...)                                                 \
  spvproof::util::LogManager::GetLogger("circuit")->trace(__VA_ARGS__)
#define LOG_CIRCUIT_DEBUG(...)                                                 \
  spvproof::util::LogManager::GetLogger("circuit")->debug(__VA_ARGS__)
#define LOG_CIRCUIT_INFO(...)                                                  \
  spvproof::util::LogManager::GetLogger("circuit")->info(__VA_ARGS__)
#define LOG_CIRCUIT_WARN(...)                                                  \
  spvproof::util::LogManager::GetLogger("circuit")->warn(__VA_ARGS__)

#define LOG_CRYPTO_TRACE(...)                                                  \
  spvproof::util::LogManager::GetLogger("crypto")->trace(__VA_ARGS__)
#define LOG_CRYPTO_DEBUG(...)                                                  \
  spvproof::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  spvproof::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  spvproof::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
