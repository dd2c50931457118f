// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "storage/database.hpp"

#include <atomic>
#include <map>
#include <mutex>

namespace shardnet {
namespace storage {

// In-memory Database for tests and ephemeral nodes. Failure injection lets
// tests exercise callers' handling of StorageError.
class MemoryDatabase : public Database {
public:
  std::optional<std::string> Get(DBCol col, std::string_view key) const override;
  void Write(const DBTransaction& tx) override;
  void ForEach(DBCol col, const std::function<void(std::string_view, std::string_view)>& fn) const override;

  void SetFailReads(bool fail) { fail_reads_ = fail; }
  void SetFailWrites(bool fail) { fail_writes_ = fail; }

  // Number of Get / Write calls, including failed ones.
  size_t GetReadCount() const { return read_count_.load(); }
  size_t GetWriteCount() const { return write_count_.load(); }

  size_t Size(DBCol col) const;

private:
  mutable std::mutex mutex_;
  std::map<DBCol, std::map<std::string, std::string, std::less<>>> columns_;

  std::atomic<bool> fail_reads_{false};
  std::atomic<bool> fail_writes_{false};
  mutable std::atomic<size_t> read_count_{0};
  std::atomic<size_t> write_count_{0};
};

}  // namespace storage
}  // namespace shardnet
