// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "storage/memory_database.hpp"

namespace shardnet {
namespace storage {

std::optional<std::string> MemoryDatabase::Get(DBCol col, std::string_view key) const {
  read_count_++;
  if (fail_reads_) {
    throw StorageError(std::string("injected read failure on column ") + ColumnName(col));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto col_it = columns_.find(col);
  if (col_it == columns_.end()) {
    return std::nullopt;
  }
  auto it = col_it->second.find(key);
  if (it == col_it->second.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryDatabase::Write(const DBTransaction& tx) {
  write_count_++;
  if (fail_writes_) {
    throw StorageError("injected write failure");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& op : tx.ops()) {
    auto& column = columns_[op.col];
    if (op.kind == DBTransaction::OpKind::Set) {
      column.insert_or_assign(op.key, op.value);
    } else {
      column.erase(op.key);
    }
  }
}

void MemoryDatabase::ForEach(DBCol col, const std::function<void(std::string_view, std::string_view)>& fn) const {
  read_count_++;
  if (fail_reads_) {
    throw StorageError(std::string("injected read failure on column ") + ColumnName(col));
  }

  // Copy out so fn may call back into the database
  std::map<std::string, std::string, std::less<>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = columns_.find(col);
    if (it != columns_.end()) {
      snapshot = it->second;
    }
  }
  for (const auto& [key, value] : snapshot) {
    fn(key, value);
  }
}

size_t MemoryDatabase::Size(DBCol col) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = columns_.find(col);
  return it == columns_.end() ? 0 : it->second.size();
}

}  // namespace storage
}  // namespace shardnet
