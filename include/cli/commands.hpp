// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 shardnet-cli commands

 Argument parsing and command handlers for the routing CLI. Handlers write
 results to `out` and diagnostics to `err`, and return the process exit code.
*/

#include "network/announce_account_cache.hpp"
#include "network/routing_config.hpp"
#include "network/routing_table_view.hpp"
#include "network/store.hpp"
#include "util/clock.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace shardnet {
namespace cli {

// Database directory under the data directory
inline constexpr const char* ANNOUNCEMENTS_DB_DIR = "announcements";

struct CliOptions {
  std::string datadir;
  std::string config_path;
  std::string log_level{"off"};
  std::string command;
  std::vector<std::string> params;
  bool help{false};
};

// Parse arguments (program name excluded). Returns nullopt after writing a
// message to err when an option is malformed.
std::optional<CliOptions> ParseArgs(const std::vector<std::string>& args, std::ostream& err);

void PrintUsage(const std::string& program_name, std::ostream& out);

// Load a {"<destination hex>": ["<hop hex>", ...]} table. Returns nullptr
// after writing a message to err if the file is unreadable, malformed, names
// an invalid peer id or gives a destination no hops.
std::shared_ptr<network::NextHopTable> LoadNextHopTable(const std::filesystem::path& path, std::ostream& err);

int CmdListAnnouncements(network::Store& store, std::ostream& out);
int CmdGetAccountOwner(network::AnnounceAccountCache& cache, const std::vector<std::string>& params,
                       std::ostream& out, std::ostream& err);
// Prints the announcements that are new to the cache, as a JSON array.
int CmdAddAnnouncement(network::AnnounceAccountCache& cache, const std::vector<std::string>& params,
                       std::ostream& out, std::ostream& err);
// Prints `count` successive next hops for a destination.
int CmdFindRoute(const util::Clock& clock, const network::RoutingConfig& config,
                 const std::vector<std::string>& params, std::ostream& out, std::ostream& err);

// Load configuration, open the data directory if the command needs it and
// dispatch. Throws StorageError on database failure.
int Run(const CliOptions& options, std::ostream& out, std::ostream& err);

}  // namespace cli
}  // namespace shardnet
