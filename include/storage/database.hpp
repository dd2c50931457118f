// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Database - narrow key-value interface the network store is built on

 - Keys and values are opaque byte strings, grouped into logical columns.
 - Writes are grouped into a DBTransaction and applied atomically.
 - Every failure is reported as StorageError. A StorageError means I/O failure
   or corruption; callers do not try to repair state.
*/

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace shardnet {
namespace storage {

enum class DBCol : uint8_t {
  // AccountId -> AnnounceAccount
  AccountAnnouncements,
};

inline constexpr DBCol ALL_COLUMNS[] = {DBCol::AccountAnnouncements};

const char* ColumnName(DBCol col);
std::optional<DBCol> ColumnFromName(std::string_view name);

class StorageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class DBTransaction {
public:
  enum class OpKind { Set, Delete };

  struct Op {
    OpKind kind;
    DBCol col;
    std::string key;
    std::string value;  // empty for Delete
  };

  void Set(DBCol col, std::string key, std::string value) {
    ops_.push_back({OpKind::Set, col, std::move(key), std::move(value)});
  }

  void Delete(DBCol col, std::string key) { ops_.push_back({OpKind::Delete, col, std::move(key), {}}); }

  const std::vector<Op>& ops() const { return ops_; }
  bool empty() const { return ops_.empty(); }
  size_t size() const { return ops_.size(); }

private:
  std::vector<Op> ops_;
};

class Database {
public:
  virtual ~Database() = default;

  // Throws StorageError.
  virtual std::optional<std::string> Get(DBCol col, std::string_view key) const = 0;

  // Apply all operations of tx, in order, or none of them. Throws StorageError.
  virtual void Write(const DBTransaction& tx) = 0;

  // Visit every entry of a column in key order. Throws StorageError.
  virtual void ForEach(DBCol col, const std::function<void(std::string_view key, std::string_view value)>& fn) const = 0;
};

}  // namespace storage
}  // namespace shardnet
