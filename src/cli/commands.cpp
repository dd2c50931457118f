// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/commands.hpp"

#include "storage/rocksdb_database.hpp"
#include "util/files.hpp"

#include <charconv>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace shardnet {
namespace cli {

namespace {

std::optional<int> ParseCount(const std::string& s) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<CliOptions> ParseArgs(const std::vector<std::string>& args, std::ostream& err) {
  CliOptions options;
  for (const auto& arg : args) {
    if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg.starts_with("--datadir=")) {
      options.datadir = arg.substr(10);
      if (options.datadir.empty()) {
        err << "Error: --datadir requires a non-empty path\n";
        return std::nullopt;
      }
    } else if (arg.starts_with("--config=")) {
      options.config_path = arg.substr(9);
    } else if (arg.starts_with("--loglevel=")) {
      options.log_level = arg.substr(11);
    } else if (arg.starts_with("--")) {
      err << "Error: unknown option " << arg << "\n";
      return std::nullopt;
    } else if (options.command.empty()) {
      options.command = arg;
    } else {
      options.params.push_back(arg);
    }
  }
  return options;
}

void PrintUsage(const std::string& program_name, std::ostream& out) {
  out << "Shardnet routing CLI - inspect account announcements and next-hop routing\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.shardnet)\n"
      << "  --config=<file>      Routing configuration (JSON)\n"
      << "  --loglevel=<level>   trace, debug, info, warn, error, off (default: off)\n"
      << "  --help               Show this help message\n\n"
      << "Commands:\n"
      << "  listannouncements                    List stored account announcements\n"
      << "  getaccountowner <account_id>         Show the peer hosting an account\n"
      << "  addannouncement <json>               Add an announcement, print what would be broadcast\n"
      << "  findroute <nexthops.json> <peer_id> [count]\n"
      << "                                       Print successive next hops for a destination\n"
      << std::endl;
}

std::shared_ptr<network::NextHopTable> LoadNextHopTable(const std::filesystem::path& path, std::ostream& err) {
  auto contents = util::read_file_string(path);
  if (!contents) {
    err << "Error: cannot read next-hop table " << path.string() << "\n";
    return nullptr;
  }

  json j = json::parse(*contents, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    err << "Error: next-hop table " << path.string() << " is not a JSON object\n";
    return nullptr;
  }

  auto table = std::make_shared<network::NextHopTable>();
  for (const auto& [destination, hops] : j.items()) {
    auto dest = network::PeerId::FromHex(destination);
    if (!dest) {
      err << "Error: invalid peer id " << destination << " in " << path.string() << "\n";
      return nullptr;
    }
    if (!hops.is_array() || hops.empty()) {
      err << "Error: destination " << destination << " has no next hops in " << path.string() << "\n";
      return nullptr;
    }

    std::vector<network::PeerId> peers;
    peers.reserve(hops.size());
    for (const auto& hop : hops) {
      auto peer = hop.is_string() ? network::PeerId::FromHex(hop.get<std::string>()) : std::nullopt;
      if (!peer) {
        err << "Error: invalid peer id " << hop.dump() << " in " << path.string() << "\n";
        return nullptr;
      }
      peers.push_back(*peer);
    }
    (*table)[*dest] = std::move(peers);
  }
  return table;
}

int CmdListAnnouncements(network::Store& store, std::ostream& out) {
  json result = json::array();
  for (const auto& aa : store.GetAllAccountAnnouncements()) {
    result.push_back(aa);
  }
  out << result.dump(2) << std::endl;
  return 0;
}

int CmdGetAccountOwner(network::AnnounceAccountCache& cache, const std::vector<std::string>& params,
                       std::ostream& out, std::ostream& err) {
  if (params.size() != 1) {
    err << "Error: getaccountowner requires <account_id>\n";
    return 1;
  }
  auto owner = cache.GetAccountOwner(params[0]);
  if (!owner) {
    err << "Account " << params[0] << " has no known owner\n";
    return 1;
  }
  out << owner->GetHex() << std::endl;
  return 0;
}

int CmdAddAnnouncement(network::AnnounceAccountCache& cache, const std::vector<std::string>& params,
                       std::ostream& out, std::ostream& err) {
  if (params.size() != 1) {
    err << "Error: addannouncement requires <json>\n";
    return 1;
  }

  network::AnnounceAccount aa;
  try {
    aa = json::parse(params[0]).get<network::AnnounceAccount>();
  } catch (const json::exception& e) {
    err << "Error: invalid announcement: " << e.what() << "\n";
    return 1;
  } catch (const std::invalid_argument& e) {
    err << "Error: invalid announcement: " << e.what() << "\n";
    return 1;
  }

  json result = json::array();
  for (const auto& delta : cache.AddAccounts({aa})) {
    result.push_back(delta);
  }
  out << result.dump(2) << std::endl;
  return 0;
}

int CmdFindRoute(const util::Clock& clock, const network::RoutingConfig& config,
                 const std::vector<std::string>& params, std::ostream& out, std::ostream& err) {
  if (params.size() < 2 || params.size() > 3) {
    err << "Error: findroute requires <nexthops.json> <peer_id> [count]\n";
    return 1;
  }
  auto target = network::PeerId::FromHex(params[1]);
  if (!target) {
    err << "Error: invalid peer id " << params[1] << "\n";
    return 1;
  }
  int count = 1;
  if (params.size() == 3) {
    auto parsed = ParseCount(params[2]);
    if (!parsed || *parsed <= 0) {
      err << "Error: count must be a positive integer\n";
      return 1;
    }
    count = *parsed;
  }
  auto table = LoadNextHopTable(params[0], err);
  if (!table) {
    return 1;
  }

  network::RoutingTableView view(clock, config);
  view.Update(std::move(table));
  for (int i = 0; i < count; ++i) {
    auto result = view.FindRoute(*target);
    if (!result.ok()) {
      err << "Error: " << network::ToString(result.error) << "\n";
      return 1;
    }
    out << result.next_hop->GetHex() << std::endl;
  }
  return 0;
}

int Run(const CliOptions& options, std::ostream& out, std::ostream& err) {
  network::RoutingConfig config;
  if (!options.config_path.empty() && !network::LoadRoutingConfig(options.config_path, config)) {
    err << "Error: invalid routing configuration " << options.config_path << "\n";
    return 1;
  }

  if (options.command == "findroute") {
    return CmdFindRoute(util::SystemClock::Instance(), config, options.params, out, err);
  }
  if (options.command != "listannouncements" && options.command != "getaccountowner" &&
      options.command != "addannouncement") {
    err << "Error: unknown command '" << options.command << "'\n";
    return 1;
  }

  std::filesystem::path datadir = options.datadir;
  if (datadir.empty()) {
    datadir = util::get_default_datadir();
    if (datadir.empty()) {
      err << "Error: HOME environment variable not set.\n"
          << "Please set HOME or use --datadir explicitly.\n";
      return 1;
    }
  }
  if (!util::ensure_directory(datadir)) {
    err << "Error: cannot create data directory " << datadir.string() << "\n";
    return 1;
  }

  network::Store store(std::make_shared<storage::RocksDatabase>(datadir / ANNOUNCEMENTS_DB_DIR));
  if (options.command == "listannouncements") {
    return CmdListAnnouncements(store, out);
  }

  network::AnnounceAccountCache cache(store, config);
  if (options.command == "getaccountowner") {
    return CmdGetAccountOwner(cache, options.params, out, err);
  }
  return CmdAddAnnouncement(cache, options.params, out, err);
}

}  // namespace cli
}  // namespace shardnet
