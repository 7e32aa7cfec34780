// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>
#include <vector>

namespace spvproof {
namespace util {

namespace {

constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

std::once_flag s_init_flag;

// Guards every access to s_loggers
std::mutex s_loggers_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

spdlog::sink_ptr MakeConsoleSink() {
  // stderr keeps stdout clean for the commitment JSON
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  sink->set_pattern(kPattern);
  return sink;
}

void InitializeInternal(const std::string &log_level, bool log_to_file,
                        const std::string &log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;

  if (log_to_file) {
    namespace fs = std::filesystem;
    fs::path p = log_file_path.empty() ? fs::path("spvproof.log")
                                       : fs::path(log_file_path);
    if (p.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(p.parent_path(), ec);
      if (ec) {
        std::cerr << "Cannot create log directory " << p.parent_path()
                  << ": " << ec.message() << "\n";
      }
    }
    try {
      // Rotating file sink (max 10MB per file, 3 files total)
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          p.string(), 10 * 1024 * 1024, 3);
      file_sink->set_pattern(kPattern);
      sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex &ex) {
      std::cerr << "Failed to initialize file logger (" << ex.what()
                << "), falling back to console logging\n";
      sinks.push_back(MakeConsoleSink());
    }
  } else {
    sinks.push_back(MakeConsoleSink());
  }

  const std::vector<std::string> components = {"default", "chain", "crypto",
                                               "circuit", "app"};
  const auto level = spdlog::level::from_str(log_level);

  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  for (const auto &component : components) {
    auto logger =
        std::make_shared<spdlog::logger>(component, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::drop(component);
    spdlog::register_logger(logger);
    s_loggers[component] = logger;
  }
  spdlog::set_default_logger(s_loggers["default"]);

  // Direct access: LOG_INFO would re-enter GetLogger() and the mutex
  if (level != spdlog::level::off) {
    s_loggers["default"]->debug("Logging system initialized (level: {})",
                                log_level);
  }
}

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file,
                 log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  for (auto &[name, logger] : s_loggers) {
    logger->flush();
  }
  spdlog::shutdown();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  auto def = s_loggers.find("default");
  if (def != s_loggers.end()) {
    return def->second;
  }

  // After Shutdown(): hand out a silent logger so late log calls are no-ops
  auto logger = std::make_shared<spdlog::logger>("default", MakeConsoleSink());
  logger->set_level(spdlog::level::off);
  s_loggers["default"] = logger;
  return logger;
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  const auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }
}

bool LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  auto it = s_loggers.find(component);
  if (it == s_loggers.end()) {
    return false;
  }
  it->second->set_level(spdlog::level::from_str(level));
  return true;
}

} // namespace util
} // namespace spvproof
