// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <mutex>

namespace shardnet {
namespace util {

/**
 * Clock - source of the current instant for time-dependent components
 *
 * Components that apply expiry (e.g. the route-back cache) read time through
 * this interface so tests can drive them with virtual time.
 */
class Clock {
public:
  using time_point = std::chrono::steady_clock::time_point;
  using duration = std::chrono::steady_clock::duration;

  virtual ~Clock() = default;

  virtual time_point Now() const = 0;
};

// Process clock. Follows util::SetMockTime when mock time is active.
class SystemClock final : public Clock {
public:
  time_point Now() const override;

  // Shared instance for production wiring.
  static const SystemClock& Instance();
};

// Manually driven clock for tests. Starts at an arbitrary fixed instant.
class FakeClock final : public Clock {
public:
  FakeClock() = default;
  explicit FakeClock(time_point start) : now_(start) {}

  time_point Now() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
  }

  void Advance(duration d) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += d;
  }

  void Set(time_point t) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = t;
  }

private:
  mutable std::mutex mutex_;
  time_point now_{std::chrono::hours(24)};
};

}  // namespace util
}  // namespace shardnet
