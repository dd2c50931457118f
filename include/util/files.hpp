// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <ios>
#include <optional>
#include <string>

namespace shardnet {
namespace util {

// Read a whole file. Returns nullopt if the file cannot be opened or read,
// or exceeds MAX_READ_FILE_SIZE.
std::optional<std::string> read_file_string(const std::filesystem::path& path);

// Create directory (and parents). Returns true if it exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

// ~/.shardnet on Linux, ~/Library/Application Support/Shardnet on macOS.
// Empty path if HOME is unset.
std::filesystem::path get_default_datadir();

inline constexpr std::streamsize MAX_READ_FILE_SIZE = 100 * 1024 * 1024;

}  // namespace util
}  // namespace shardnet
