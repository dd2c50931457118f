// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace shardnet {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  const auto now = GetSteadyTime();
  const double capacity = static_cast<double>(tokens_per_period);

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(callsite_key);
  TokenBucket& bucket = it->second;

  if (inserted) {
    bucket.tokens = capacity;
    bucket.last_refill = now;
  } else if (period_seconds > 0) {
    // Whole seconds only, so partial seconds keep accruing until they count
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.last_refill);
    if (elapsed.count() > 0) {
      bucket.tokens = std::min(capacity, bucket.tokens + capacity * elapsed.count() / period_seconds);
      bucket.last_refill += elapsed;
    }
  }

  if (bucket.tokens < 1.0) {
    return false;
  }
  bucket.tokens -= 1.0;
  return true;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace shardnet
