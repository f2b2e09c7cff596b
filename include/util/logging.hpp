// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#ifndef WATCHTOWER_UTIL_LOGGING_HPP
#define WATCHTOWER_UTIL_LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace watchtower {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * ("default", "network", "tower", "app").
 *
 * Thread-safety: All methods are thread-safe. Logger lookup and
 * (re)initialization are serialized by an internal mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization; later calls are no-ops
   * until Shutdown().
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "tower", "app")
   *
   * Auto-initializes with defaults if not initialized. Unknown names fall
   * back to the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  static bool IsInitialized();
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
#define LOG_CRITICAL(...)                                                      \
  watchtower::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  watchtower::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  watchtower::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  watchtower::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  watchtower::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  watchtower::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_TOWER_TRACE(...)                                                   \
  watchtower::util::LogManager::GetLogger("tower")->trace(__VA_ARGS__)
#define LOG_TOWER_DEBUG(...)                                                   \
  watchtower::util::LogManager::GetLogger("tower")->debug(__VA_ARGS__)
#define LOG_TOWER_INFO(...)                                                    \
  watchtower::util::LogManager::GetLogger("tower")->info(__VA_ARGS__)
#define LOG_TOWER_WARN(...)                                                    \
  watchtower::util::LogManager::GetLogger("tower")->warn(__VA_ARGS__)
#define LOG_TOWER_ERROR(...)                                                   \
  watchtower::util::LogManager::GetLogger("tower")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  watchtower::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  watchtower::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  watchtower::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

#endif // WATCHTOWER_UTIL_LOGGING_HPP
