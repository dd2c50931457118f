// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 RocksDatabase - durable Database backed by RocksDB

 - One column family per DBCol, named by ColumnName(). Missing families are
   created on open. Families on disk that this build does not know are opened
   and left untouched.
 - A DBTransaction is applied as a single rocksdb::WriteBatch, so it commits
   atomically.
 - Any non-OK rocksdb::Status (other than NotFound on Get) is raised as
   StorageError. RocksDB holds a LOCK file, so a second open of the same
   directory fails while the first is alive.
*/

#include "storage/database.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <vector>

namespace rocksdb {
class ColumnFamilyHandle;
class DB;
}  // namespace rocksdb

namespace shardnet {
namespace storage {

class RocksDatabase : public Database {
public:
  // Opens or creates the database directory at path. Throws StorageError.
  explicit RocksDatabase(std::filesystem::path path);
  ~RocksDatabase() override;

  RocksDatabase(const RocksDatabase&) = delete;
  RocksDatabase& operator=(const RocksDatabase&) = delete;

  std::optional<std::string> Get(DBCol col, std::string_view key) const override;
  void Write(const DBTransaction& tx) override;
  void ForEach(DBCol col, const std::function<void(std::string_view, std::string_view)>& fn) const override;

  const std::filesystem::path& GetPath() const { return path_; }

private:
  rocksdb::ColumnFamilyHandle* Handle(DBCol col) const;

  std::filesystem::path path_;
  std::unique_ptr<rocksdb::DB> db_;
  // Every handle returned by Open, including "default" and unknown families
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  std::map<DBCol, rocksdb::ColumnFamilyHandle*> columns_;
};

}  // namespace storage
}  // namespace shardnet
