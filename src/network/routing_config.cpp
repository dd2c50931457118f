// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/routing_config.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"

#include <cstdint>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace shardnet {
namespace network {

namespace {

// Reads a positive integer field if present. Throws json::exception on type errors.
bool ReadPositive(const json& j, const char* key, int64_t& out) {
  if (!j.contains(key)) {
    return true;
  }
  int64_t value = j.at(key).get<int64_t>();
  if (value <= 0) {
    LOG_ERROR("LoadRoutingConfig: {} must be positive (got {})", key, value);
    return false;
  }
  out = value;
  return true;
}

}  // namespace

bool LoadRoutingConfig(const std::string& path, RoutingConfig& config) {
  auto contents = util::read_file_string(path);
  if (!contents) {
    LOG_ERROR("LoadRoutingConfig: cannot read {}", path);
    return false;
  }

  try {
    json j = json::parse(*contents);
    if (!j.is_object()) {
      LOG_ERROR("LoadRoutingConfig: {} is not a JSON object", path);
      return false;
    }

    int64_t announce = static_cast<int64_t>(config.announce_cache_size);
    int64_t route_back = static_cast<int64_t>(config.route_back_capacity);
    int64_t ttl = config.route_back_ttl.count();
    int64_t last_routed = static_cast<int64_t>(config.last_routed_cache_size);

    if (!ReadPositive(j, "announce_cache_size", announce) || !ReadPositive(j, "route_back_capacity", route_back) ||
        !ReadPositive(j, "route_back_ttl_secs", ttl) || !ReadPositive(j, "last_routed_cache_size", last_routed)) {
      return false;
    }

    config.announce_cache_size = static_cast<size_t>(announce);
    config.route_back_capacity = static_cast<size_t>(route_back);
    config.route_back_ttl = std::chrono::seconds(ttl);
    config.last_routed_cache_size = static_cast<size_t>(last_routed);

    LOG_DEBUG("LoadRoutingConfig: announce_cache_size={} route_back_capacity={} route_back_ttl={}s "
              "last_routed_cache_size={}",
              config.announce_cache_size, config.route_back_capacity, config.route_back_ttl.count(),
              config.last_routed_cache_size);
    return true;
  } catch (const json::exception& e) {
    LOG_ERROR("LoadRoutingConfig: failed to parse {}: {}", path, e.what());
    return false;
  }
}

}  // namespace network
}  // namespace shardnet
