// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 RouteBackCache - request hash -> previous hop, for replying along the
 inverse path of a routed request

 Policy
 - Bounded: at most `capacity` entries. Beyond that the oldest-inserted
   entries are dropped first, regardless of age.
 - Expiring: an entry inserted at t is present while now - t <= ttl. Expired
   entries are never returned. Memory is reclaimed lazily: Insert() drops
   expired entries from the old end before evicting live ones. With a
   monotonic clock insertion order is time order, so after any Insert() no
   expired entry remains; there is no separate sweep.
 - Re-inserting a live (hash, previous_hop) pair is a no-op. Re-inserting a
   hash with a different previous hop replaces it (last writer wins) and
   restarts its lifetime.

 Not thread-safe; RoutingTableView guards it with its own mutex.
*/

#include "network/types.hpp"
#include "util/clock.hpp"

#include <chrono>
#include <list>
#include <optional>
#include <unordered_map>

namespace shardnet {
namespace network {

class RouteBackCache {
public:
  using time_point = util::Clock::time_point;
  using duration = util::Clock::duration;

  RouteBackCache(size_t capacity, duration ttl);

  RouteBackCache(const RouteBackCache&) = delete;
  RouteBackCache& operator=(const RouteBackCache&) = delete;

  void Insert(time_point now, const CryptoHash& hash, const PeerId& previous_hop);

  // Return and delete the entry if present and not expired.
  std::optional<PeerId> Remove(time_point now, const CryptoHash& hash);

  // Peek without deletion.
  std::optional<PeerId> Get(time_point now, const CryptoHash& hash) const;

  // Stored entries, including ones expired since the last Insert().
  size_t Size() const { return entries_.size(); }
  size_t Capacity() const { return capacity_; }

private:
  struct Entry {
    CryptoHash hash;
    PeerId previous_hop;
    time_point inserted_at;
  };
  using EntryList = std::list<Entry>;
  using Index = std::unordered_map<CryptoHash, EntryList::iterator, FixedHashHasher>;

  bool IsExpired(const Entry& entry, time_point now) const { return now - entry.inserted_at > ttl_; }

  void Erase(Index::iterator it);

  size_t capacity_;
  duration ttl_;
  EntryList entries_;  // front = oldest insertion
  Index index_;
};

}  // namespace network
}  // namespace shardnet
