// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "storage/rocksdb_database.hpp"

#include "util/logging.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include <algorithm>

namespace shardnet {
namespace storage {

namespace {

[[noreturn]] void Fail(const std::string& what, const rocksdb::Status& status) {
  throw StorageError(what + ": " + status.ToString());
}

rocksdb::Slice ToSlice(std::string_view s) {
  return rocksdb::Slice(s.data(), s.size());
}

}  // namespace

RocksDatabase::RocksDatabase(std::filesystem::path path) : path_(std::move(path)) {
  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  // Open every family already on disk; RocksDB refuses to open otherwise
  std::vector<std::string> names;
  rocksdb::Status status = rocksdb::DB::ListColumnFamilies(options, path_.string(), &names);
  if (!status.ok()) {
    names.clear();
  }
  if (std::find(names.begin(), names.end(), rocksdb::kDefaultColumnFamilyName) == names.end()) {
    names.push_back(rocksdb::kDefaultColumnFamilyName);
  }
  for (DBCol col : ALL_COLUMNS) {
    if (std::find(names.begin(), names.end(), ColumnName(col)) == names.end()) {
      names.emplace_back(ColumnName(col));
    }
  }

  std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
  descriptors.reserve(names.size());
  for (const auto& name : names) {
    descriptors.emplace_back(name, rocksdb::ColumnFamilyOptions(options));
  }

  rocksdb::DB* raw = nullptr;
  status = rocksdb::DB::Open(options, path_.string(), descriptors, &handles_, &raw);
  if (!status.ok()) {
    Fail("failed to open database " + path_.string(), status);
  }
  db_.reset(raw);

  for (size_t i = 0; i < names.size(); ++i) {
    if (auto col = ColumnFromName(names[i])) {
      columns_[*col] = handles_[i];
    } else if (names[i] != rocksdb::kDefaultColumnFamilyName) {
      LOG_STORAGE_WARN("RocksDatabase: ignoring unknown column family {} in {}", names[i], path_.string());
    }
  }
  LOG_STORAGE_DEBUG("RocksDatabase: opened {} with {} column families", path_.string(), handles_.size());
}

RocksDatabase::~RocksDatabase() {
  for (auto* handle : handles_) {
    rocksdb::Status status = db_->DestroyColumnFamilyHandle(handle);
    if (!status.ok()) {
      LOG_STORAGE_WARN("RocksDatabase: failed to release column family handle: {}", status.ToString());
    }
  }
  rocksdb::Status status = db_->Close();
  if (!status.ok()) {
    LOG_STORAGE_WARN("RocksDatabase: close of {} failed: {}", path_.string(), status.ToString());
  }
}

rocksdb::ColumnFamilyHandle* RocksDatabase::Handle(DBCol col) const {
  auto it = columns_.find(col);
  if (it == columns_.end()) {
    throw StorageError(std::string("column family not open: ") + ColumnName(col));
  }
  return it->second;
}

std::optional<std::string> RocksDatabase::Get(DBCol col, std::string_view key) const {
  std::string value;
  rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), Handle(col), ToSlice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    Fail(std::string("read from ") + ColumnName(col) + " failed", status);
  }
  return value;
}

void RocksDatabase::Write(const DBTransaction& tx) {
  if (tx.empty()) {
    return;
  }

  rocksdb::WriteBatch batch;
  for (const auto& op : tx.ops()) {
    rocksdb::Status status = op.kind == DBTransaction::OpKind::Set
                                 ? batch.Put(Handle(op.col), op.key, op.value)
                                 : batch.Delete(Handle(op.col), op.key);
    if (!status.ok()) {
      Fail("failed to stage write", status);
    }
  }

  rocksdb::Status status = db_->Write(rocksdb::WriteOptions(), &batch);
  if (!status.ok()) {
    Fail("write to " + path_.string() + " failed", status);
  }
  LOG_STORAGE_TRACE("RocksDatabase: committed {} ops to {}", tx.size(), path_.string());
}

void RocksDatabase::ForEach(DBCol col,
                            const std::function<void(std::string_view, std::string_view)>& fn) const {
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), Handle(col)));
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    fn(std::string_view(it->key().data(), it->key().size()), std::string_view(it->value().data(), it->value().size()));
  }
  if (!it->status().ok()) {
    Fail(std::string("iteration over ") + ColumnName(col) + " failed", it->status());
  }
}

}  // namespace storage
}  // namespace shardnet
