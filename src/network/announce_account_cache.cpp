// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/announce_account_cache.hpp"

#include "util/logging.hpp"

namespace shardnet {
namespace network {

AnnounceAccountCache::AnnounceAccountCache(Store store, const RoutingConfig& config)
    : account_peers_(config.announce_cache_size),
      account_peers_broadcasted_(config.announce_cache_size),
      store_(std::move(store)) {}

std::vector<AnnounceAccount> AnnounceAccountCache::AddAccounts(const std::vector<AnnounceAccount>& announcements) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<AnnounceAccount> broadcast;
  for (const auto& aa : announcements) {
    // Already broadcast for this epoch
    const AnnounceAccount* sent = account_peers_broadcasted_.get(aa.account_id);
    if (sent && sent->epoch_id == aa.epoch_id) {
      continue;
    }

    account_peers_.put(aa.account_id, aa);
    account_peers_broadcasted_.put(aa.account_id, aa);

    // Best effort: memory already holds the update and the network will replay it
    try {
      store_.SetAccountAnnouncement(aa.account_id, aa);
    } catch (const storage::StorageError& e) {
      LOG_NET_WARN_RL("AnnounceAccountCache: error saving announce account {} to store: {}", aa.account_id,
                      e.what());
    }

    LOG_NET_TRACE("AnnounceAccountCache: account {} -> peer {} (epoch {})", aa.account_id, aa.peer_id.ToString(),
                  aa.epoch_id.ToString());
    broadcast.push_back(aa);
  }
  return broadcast;
}

std::optional<AnnounceAccount> AnnounceAccountCache::GetAnnouncementLocked(const AccountId& account_id) {
  if (const AnnounceAccount* cached = account_peers_.get(account_id)) {
    return *cached;
  }

  std::optional<AnnounceAccount> stored;
  try {
    stored = store_.GetAccountAnnouncement(account_id);
  } catch (const storage::StorageError& e) {
    LOG_NET_WARN_RL("AnnounceAccountCache: error loading announce account {} from store: {}", account_id, e.what());
    return std::nullopt;
  }

  if (stored) {
    account_peers_.put(account_id, *stored);
  }
  return stored;
}

std::optional<AnnounceAccount> AnnounceAccountCache::GetAnnouncement(const AccountId& account_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return GetAnnouncementLocked(account_id);
}

std::optional<PeerId> AnnounceAccountCache::GetAccountOwner(const AccountId& account_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto aa = GetAnnouncementLocked(account_id);
  if (!aa) {
    return std::nullopt;
  }
  return aa->peer_id;
}

std::set<AccountId> AnnounceAccountCache::GetAccountsKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<AccountId> keys;
  for (const auto& [account_id, aa] : account_peers_) {
    keys.insert(account_id);
  }
  return keys;
}

std::vector<AnnounceAccount> AnnounceAccountCache::GetAnnouncements() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AnnounceAccount> result;
  result.reserve(account_peers_.size());
  for (const auto& [account_id, aa] : account_peers_) {
    result.push_back(aa);
  }
  return result;
}

std::map<AccountId, AnnounceAccount> AnnounceAccountCache::GetBroadcastedAnnouncements(
    const std::vector<AccountId>& account_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<AccountId, AnnounceAccount> result;
  for (const auto& account_id : account_ids) {
    if (const AnnounceAccount* aa = account_peers_broadcasted_.get(account_id)) {
      result.emplace(account_id, *aa);
    }
  }
  return result;
}

}  // namespace network
}  // namespace shardnet
