// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Store - typed facade over the node database for network state

 Every error is a storage::StorageError: a critical operational error that
 signals I/O failure or data corruption. Callers log it and carry on; they
 never try to repair the database.
*/

#include "network/types.hpp"
#include "storage/database.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace shardnet {
namespace network {

class Store {
public:
  explicit Store(std::shared_ptr<storage::Database> db);

  // Insert (account_id, aa) into the AccountAnnouncements column as a single
  // committed transaction.
  void SetAccountAnnouncement(const AccountId& account_id, const AnnounceAccount& aa);

  // Fetch the row for account_id. A row that does not decode is reported as
  // corruption (StorageError).
  std::optional<AnnounceAccount> GetAccountAnnouncement(const AccountId& account_id) const;

  // Every stored announcement, in account id order.
  std::vector<AnnounceAccount> GetAllAccountAnnouncements() const;

private:
  std::shared_ptr<storage::Database> db_;
};

}  // namespace network
}  // namespace shardnet
