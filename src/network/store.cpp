// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/store.hpp"

#include "util/logging.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace shardnet {
namespace network {

Store::Store(std::shared_ptr<storage::Database> db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("Store requires a database");
  }
}

void Store::SetAccountAnnouncement(const AccountId& account_id, const AnnounceAccount& aa) {
  LOG_STORAGE_TRACE("Store::SetAccountAnnouncement account={}", account_id);
  storage::DBTransaction tx;
  tx.Set(storage::DBCol::AccountAnnouncements, account_id, json(aa).dump());
  db_->Write(tx);
}

namespace {

AnnounceAccount DecodeAnnouncement(std::string_view account_id, std::string_view raw) {
  try {
    return json::parse(raw).get<AnnounceAccount>();
  } catch (const json::exception& e) {
    throw storage::StorageError("corrupt announcement for account " + std::string(account_id) + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw storage::StorageError("corrupt announcement for account " + std::string(account_id) + ": " + e.what());
  }
}

}  // namespace

std::optional<AnnounceAccount> Store::GetAccountAnnouncement(const AccountId& account_id) const {
  auto raw = db_->Get(storage::DBCol::AccountAnnouncements, account_id);
  if (!raw) {
    return std::nullopt;
  }

  return DecodeAnnouncement(account_id, *raw);
}

std::vector<AnnounceAccount> Store::GetAllAccountAnnouncements() const {
  std::vector<AnnounceAccount> result;
  db_->ForEach(storage::DBCol::AccountAnnouncements, [&](std::string_view key, std::string_view value) {
    result.push_back(DecodeAnnouncement(key, value));
  });
  return result;
}

}  // namespace network
}  // namespace shardnet
