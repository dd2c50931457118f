// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Rate limiter for logging to prevent disk exhaustion attacks

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace shardnet {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Each callsite gets N tokens that refill linearly over a period. Used for
 * log lines that peers can trigger at will (bad announcements, store
 * failures under load).
 */
class RateLimiter {
public:
  // Returns true if the message should be logged, false if rate-limited.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill;
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace shardnet
