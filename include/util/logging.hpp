// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace shardnet {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and access to per-component
 * loggers ("default", "network", "storage").
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  // Initialize logging with the given minimum level. Only the first call
  // performs initialization; later calls are no-ops.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Flush and drop all loggers. Logging after shutdown re-initializes with defaults.
  static void Shutdown();

  // Get logger for a component. Unknown components map to "default".
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for one component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace shardnet

// Convenience macros for logging
#define LOG_TRACE(...) shardnet::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) shardnet::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) shardnet::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) shardnet::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) shardnet::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) shardnet::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) shardnet::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) shardnet::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) shardnet::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) shardnet::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_STORAGE_TRACE(...) shardnet::util::LogManager::GetLogger("storage")->trace(__VA_ARGS__)
#define LOG_STORAGE_DEBUG(...) shardnet::util::LogManager::GetLogger("storage")->debug(__VA_ARGS__)
#define LOG_STORAGE_INFO(...) shardnet::util::LogManager::GetLogger("storage")->info(__VA_ARGS__)
#define LOG_STORAGE_WARN(...) shardnet::util::LogManager::GetLogger("storage")->warn(__VA_ARGS__)
#define LOG_STORAGE_ERROR(...) shardnet::util::LogManager::GetLogger("storage")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Warnings triggered by peer traffic (announcements, routed messages) go
// through LOG_NET_WARN_RL so a flood of bad input cannot fill the disk.
// Limit: 200 messages per hour per callsite (token bucket).

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (shardnet::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                \
      shardnet::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                             \
    }                                                                                                                  \
  } while (0)
