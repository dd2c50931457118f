// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 AnnounceAccountCache - account -> owning peer, with broadcast deduplication

 Purpose
 - Answer "which peer hosts account X?" for routing by account id.
 - Decide which incoming announcements still need to be gossiped.

 Structure
 - account_peers_: LRU of the freshest known announcement per account. May hold
   entries that were never broadcast (loaded lazily from the store).
 - account_peers_broadcasted_: LRU of what we have already broadcast. Evicts
   independently of account_peers_.
 - store_: write-through persistence. Writes are best effort; reads are
   authoritative when the in-memory cache misses.

 "Freshest" means most recently accepted, not highest epoch: announcements
 are validated and ordered upstream, so the cache never compares epochs.

 Thread-safety
 - One mutex guards everything, including store calls, so a store hit is
   installed atomically with respect to concurrent AddAccounts().
*/

#include "network/routing_config.hpp"
#include "network/store.hpp"
#include "network/types.hpp"
#include "util/lru_cache.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace shardnet {
namespace network {

class AnnounceAccountCache {
public:
  explicit AnnounceAccountCache(Store store, const RoutingConfig& config = RoutingConfig{});

  AnnounceAccountCache(const AnnounceAccountCache&) = delete;
  AnnounceAccountCache& operator=(const AnnounceAccountCache&) = delete;

  // Add announcements, in order. Returns the ones that must be broadcast:
  // everything except announcements already broadcast for the same epoch.
  // At most one peer is kept per account.
  std::vector<AnnounceAccount> AddAccounts(const std::vector<AnnounceAccount>& announcements);

  // Freshest known announcement for account_id; falls back to the store on a
  // cache miss. Store errors are logged and treated as a miss.
  std::optional<AnnounceAccount> GetAnnouncement(const AccountId& account_id);

  // Peer that owns account_id, if known.
  std::optional<PeerId> GetAccountOwner(const AccountId& account_id);

  // Accounts currently in the in-memory cache (not the broadcast set, not the store).
  std::set<AccountId> GetAccountsKeys() const;

  // Announcements currently in the in-memory cache.
  std::vector<AnnounceAccount> GetAnnouncements() const;

  // Broadcast announcements for the given accounts; accounts never broadcast
  // (or evicted from the broadcast set) are omitted.
  std::map<AccountId, AnnounceAccount> GetBroadcastedAnnouncements(const std::vector<AccountId>& account_ids);

private:
  // Must be called with mutex_ held.
  std::optional<AnnounceAccount> GetAnnouncementLocked(const AccountId& account_id);

  mutable std::mutex mutex_;
  util::LruCache<AccountId, AnnounceAccount> account_peers_;
  util::LruCache<AccountId, AnnounceAccount> account_peers_broadcasted_;
  Store store_;
};

}  // namespace network
}  // namespace shardnet
