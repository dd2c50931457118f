// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/clock.hpp"

#include "util/time.hpp"

namespace shardnet {
namespace util {

Clock::time_point SystemClock::Now() const {
  return GetSteadyTime();
}

const SystemClock& SystemClock::Instance() {
  static const SystemClock instance;
  return instance;
}

}  // namespace util
}  // namespace shardnet
