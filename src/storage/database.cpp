// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "storage/database.hpp"

namespace shardnet {
namespace storage {

const char* ColumnName(DBCol col) {
  switch (col) {
  case DBCol::AccountAnnouncements:
    return "AccountAnnouncements";
  }
  return "Unknown";
}

std::optional<DBCol> ColumnFromName(std::string_view name) {
  for (DBCol col : ALL_COLUMNS) {
    if (name == ColumnName(col)) {
      return col;
    }
  }
  return std::nullopt;
}

}  // namespace storage
}  // namespace shardnet
