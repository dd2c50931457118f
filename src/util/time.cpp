// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace shardnet {
namespace util {

namespace {

// 0 disables mock time
std::atomic<int64_t> g_mock_time{0};

// While mock time is active the steady clock is simulated as
// real_anchor + (mock - mock_anchor). The anchor is taken on the first read
// and dropped when mock time is disabled, so moving mock time forward moves
// the steady clock by the same amount.
struct SteadyAnchor {
  std::mutex mutex;
  bool set{false};
  std::chrono::steady_clock::time_point real;
  int64_t mock{0};
};

SteadyAnchor& GetSteadyAnchor() {
  static SteadyAnchor anchor;
  return anchor;
}

}  // namespace

int64_t GetTime() {
  if (const int64_t mock = g_mock_time.load(std::memory_order_relaxed); mock != 0) {
    return mock;
  }
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  SteadyAnchor& anchor = GetSteadyAnchor();
  std::lock_guard<std::mutex> lock(anchor.mutex);
  if (!anchor.set) {
    anchor.real = std::chrono::steady_clock::now();
    anchor.mock = mock;
    anchor.set = true;
  }
  return anchor.real + std::chrono::seconds(mock - anchor.mock);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
  if (time == 0) {
    SteadyAnchor& anchor = GetSteadyAnchor();
    std::lock_guard<std::mutex> lock(anchor.mutex);
    anchor.set = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace shardnet
