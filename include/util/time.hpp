// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace shardnet {
namespace util {

// Current Unix time in seconds (mock time if set).
int64_t GetTime();

// Monotonic time point. When mock time is active the steady clock advances
// with the mock time instead of the wall clock.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time for testing. 0 disables mock time.
void SetMockTime(int64_t time);

int64_t GetMockTime();

// RAII guard: enables mock time for the lifetime of the scope and restores
// the previous value on exit.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace shardnet
