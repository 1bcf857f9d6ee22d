// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace watchtower {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and named component loggers
 * ("default", "chain", "rpc", "app").
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "watchtower.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown fall back to a silent logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "chain", "rpc", "app")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (chain, rpc, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace watchtower

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  watchtower::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  watchtower::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  watchtower::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  watchtower::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  watchtower::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  watchtower::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  watchtower::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  watchtower::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  watchtower::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  watchtower::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_RPC_TRACE(...)                                                     \
  watchtower::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...)                                                     \
  watchtower::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...)                                                      \
  watchtower::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  watchtower::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  watchtower::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  watchtower::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  watchtower::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  watchtower::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
