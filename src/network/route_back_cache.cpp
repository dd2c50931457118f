// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/route_back_cache.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <iterator>

namespace shardnet {
namespace network {

RouteBackCache::RouteBackCache(size_t capacity, duration ttl) : capacity_(std::max<size_t>(capacity, 1)), ttl_(ttl) {}

void RouteBackCache::Erase(Index::iterator it) {
  entries_.erase(it->second);
  index_.erase(it);
}

void RouteBackCache::Insert(time_point now, const CryptoHash& hash, const PeerId& previous_hop) {
  auto it = index_.find(hash);
  if (it != index_.end()) {
    const Entry& existing = *it->second;
    if (existing.previous_hop == previous_hop && !IsExpired(existing, now)) {
      return;
    }
    if (existing.previous_hop != previous_hop) {
      LOG_NET_TRACE("RouteBackCache: hash {} re-routed from {} to {}", hash.ToString(),
                    existing.previous_hop.ToString(), previous_hop.ToString());
    }
    Erase(it);
  }

  // Sweep expired entries from the old end before evicting live ones
  while (!entries_.empty() && IsExpired(entries_.front(), now)) {
    index_.erase(entries_.front().hash);
    entries_.pop_front();
  }

  while (entries_.size() >= capacity_) {
    index_.erase(entries_.front().hash);
    entries_.pop_front();
  }

  entries_.push_back({hash, previous_hop, now});
  index_.emplace(hash, std::prev(entries_.end()));
}

std::optional<PeerId> RouteBackCache::Remove(time_point now, const CryptoHash& hash) {
  auto it = index_.find(hash);
  if (it == index_.end()) {
    return std::nullopt;
  }

  std::optional<PeerId> result;
  if (!IsExpired(*it->second, now)) {
    result = it->second->previous_hop;
  }
  Erase(it);
  return result;
}

std::optional<PeerId> RouteBackCache::Get(time_point now, const CryptoHash& hash) const {
  auto it = index_.find(hash);
  if (it == index_.end() || IsExpired(*it->second, now)) {
    return std::nullopt;
  }
  return it->second->previous_hop;
}

}  // namespace network
}  // namespace shardnet
