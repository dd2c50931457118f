// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cstdlib>
#include <fstream>

namespace shardnet {
namespace util {

std::optional<std::string> read_file_string(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    LOG_STORAGE_DEBUG("read_file_string: cannot open {}", path.string());
    return std::nullopt;
  }

  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_STORAGE_ERROR("read_file_string: cannot stat {}: {}", path.string(), ec.message());
    return std::nullopt;
  }
  if (size > static_cast<uintmax_t>(MAX_READ_FILE_SIZE)) {
    LOG_STORAGE_ERROR("read_file_string: {} is {} bytes, limit is {}", path.string(), size, MAX_READ_FILE_SIZE);
    return std::nullopt;
  }

  std::string contents(static_cast<size_t>(size), '\0');
  if (!in.read(contents.data(), static_cast<std::streamsize>(size))) {
    LOG_STORAGE_ERROR("read_file_string: short read from {}", path.string());
    return std::nullopt;
  }
  return contents;
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return std::filesystem::is_directory(dir, ec);
}

std::filesystem::path get_default_datadir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    LOG_ERROR("get_default_datadir: HOME is not set");
    return {};
  }
#if defined(__APPLE__)
  return std::filesystem::path(home) / "Library" / "Application Support" / "Shardnet";
#else
  return std::filesystem::path(home) / ".shardnet";
#endif
}

}  // namespace util
}  // namespace shardnet
