// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace shardnet {
namespace network {

// Announcement cache capacity (both the value cache and the broadcast set)
static constexpr size_t DEFAULT_ANNOUNCE_ACCOUNT_CACHE_SIZE{10'000};
// Route-back entries kept before the oldest are dropped
static constexpr size_t DEFAULT_ROUTE_BACK_CACHE_SIZE{10'000};
// Route-back entries older than this are treated as absent
static constexpr std::chrono::seconds DEFAULT_ROUTE_BACK_TTL{120};
// Neighbors tracked for least-recently-routed tie breaking
static constexpr size_t DEFAULT_LAST_ROUTED_CACHE_SIZE{10'000};

struct RoutingConfig {
  size_t announce_cache_size{DEFAULT_ANNOUNCE_ACCOUNT_CACHE_SIZE};
  size_t route_back_capacity{DEFAULT_ROUTE_BACK_CACHE_SIZE};
  std::chrono::seconds route_back_ttl{DEFAULT_ROUTE_BACK_TTL};
  size_t last_routed_cache_size{DEFAULT_LAST_ROUTED_CACHE_SIZE};
};

// Load overrides from a JSON object file:
//   {"announce_cache_size": N, "route_back_capacity": N,
//    "route_back_ttl_secs": N, "last_routed_cache_size": N}
// Missing keys keep their current value; unknown keys are ignored.
// Returns false (config untouched) if the file is unreadable, malformed, or
// holds a non-positive value.
bool LoadRoutingConfig(const std::string& path, RoutingConfig& config);

}  // namespace network
}  // namespace shardnet
