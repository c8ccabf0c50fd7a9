// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace dropnet {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per harness component (network, chain, proxy, cluster,
 * harness) sharing the same sinks, so component levels can be raised
 * independently with --debug=<component>.
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
   * @param log_to_file If true, also log to a rotating file
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Only the first call
   * performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "dropnet.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "proxy", "harness")
   *
   * Auto-initializes if not initialized. Unknown components get the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace dropnet

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  dropnet::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  dropnet::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  dropnet::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  dropnet::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  dropnet::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  dropnet::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  dropnet::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  dropnet::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  dropnet::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  dropnet::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  dropnet::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  dropnet::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  dropnet::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  dropnet::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)

#define LOG_PROXY_TRACE(...)                                                   \
  dropnet::util::LogManager::GetLogger("proxy")->trace(__VA_ARGS__)
#define LOG_PROXY_DEBUG(...)                                                   \
  dropnet::util::LogManager::GetLogger("proxy")->debug(__VA_ARGS__)
#define LOG_PROXY_INFO(...)                                                    \
  dropnet::util::LogManager::GetLogger("proxy")->info(__VA_ARGS__)
#define LOG_PROXY_WARN(...)                                                    \
  dropnet::util::LogManager::GetLogger("proxy")->warn(__VA_ARGS__)
#define LOG_PROXY_ERROR(...)                                                   \
  dropnet::util::LogManager::GetLogger("proxy")->error(__VA_ARGS__)

#define LOG_CLUSTER_DEBUG(...)                                                 \
  dropnet::util::LogManager::GetLogger("cluster")->debug(__VA_ARGS__)
#define LOG_CLUSTER_INFO(...)                                                  \
  dropnet::util::LogManager::GetLogger("cluster")->info(__VA_ARGS__)
#define LOG_CLUSTER_WARN(...)                                                  \
  dropnet::util::LogManager::GetLogger("cluster")->warn(__VA_ARGS__)
#define LOG_CLUSTER_ERROR(...)                                                 \
  dropnet::util::LogManager::GetLogger("cluster")->error(__VA_ARGS__)

#define LOG_HARNESS_DEBUG(...)                                                 \
  dropnet::util::LogManager::GetLogger("harness")->debug(__VA_ARGS__)
#define LOG_HARNESS_INFO(...)                                                  \
  dropnet::util::LogManager::GetLogger("harness")->info(__VA_ARGS__)
#define LOG_HARNESS_WARN(...)                                                  \
  dropnet::util::LogManager::GetLogger("harness")->warn(__VA_ARGS__)
#define LOG_HARNESS_ERROR(...)                                                 \
  dropnet::util::LogManager::GetLogger("harness")->error(__VA_ARGS__)
