// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace nodeguard {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * (default, address, identity, csr, registry).
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
   * @param log_to_file If true, log to a rotating file instead of stderr
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "nodeguard.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown fall back to a silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "address", "identity", "csr")
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
   * @param component Component name (address, identity, csr, registry, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace nodeguard

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  nodeguard::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  nodeguard::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  nodeguard::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  nodeguard::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  nodeguard::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_ADDR_TRACE(...)                                                    \
  nodeguard::util::LogManager::GetLogger("address")->trace(__VA_ARGS__)
#define LOG_ADDR_DEBUG(...)                                                    \
  nodeguard::util::LogManager::GetLogger("address")->debug(__VA_ARGS__)
#define LOG_ADDR_WARN(...)                                                     \
  nodeguard::util::LogManager::GetLogger("address")->warn(__VA_ARGS__)
#define LOG_ADDR_ERROR(...)                                                    \
  nodeguard::util::LogManager::GetLogger("address")->error(__VA_ARGS__)

#define LOG_IDENT_TRACE(...)                                                   \
  nodeguard::util::LogManager::GetLogger("identity")->trace(__VA_ARGS__)
#define LOG_IDENT_DEBUG(...)                                                   \
  nodeguard::util::LogManager::GetLogger("identity")->debug(__VA_ARGS__)
#define LOG_IDENT_INFO(...)                                                    \
  nodeguard::util::LogManager::GetLogger("identity")->info(__VA_ARGS__)
#define LOG_IDENT_WARN(...)                                                    \
  nodeguard::util::LogManager::GetLogger("identity")->warn(__VA_ARGS__)
#define LOG_IDENT_ERROR(...)                                                   \
  nodeguard::util::LogManager::GetLogger("identity")->error(__VA_ARGS__)

#define LOG_CSR_DEBUG(...)                                                     \
  nodeguard::util::LogManager::GetLogger("csr")->debug(__VA_ARGS__)
#define LOG_CSR_INFO(...)                                                      \
  nodeguard::util::LogManager::GetLogger("csr")->info(__VA_ARGS__)
#define LOG_CSR_WARN(...)                                                      \
  nodeguard::util::LogManager::GetLogger("csr")->warn(__VA_ARGS__)
#define LOG_CSR_ERROR(...)                                                     \
  nodeguard::util::LogManager::GetLogger("csr")->error(__VA_ARGS__)

#define LOG_REG_TRACE(...)                                                     \
  nodeguard::util::LogManager::GetLogger("registry")->trace(__VA_ARGS__)
#define LOG_REG_DEBUG(...)                                                     \
  nodeguard::util::LogManager::GetLogger("registry")->debug(__VA_ARGS__)
