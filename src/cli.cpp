// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/commands.hpp"
#include "storage/database.hpp"
#include "util/logging.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace shardnet;

int main(int argc, char* argv[]) {
  try {
    if (argc < 2) {
      cli::PrintUsage(argv[0], std::cout);
      return 1;
    }

    auto options = cli::ParseArgs(std::vector<std::string>(argv + 1, argv + argc), std::cerr);
    if (!options) {
      return 1;
    }
    if (options->help) {
      cli::PrintUsage(argv[0], std::cout);
      return 0;
    }

    util::LogManager::Initialize(options->log_level);

    if (options->command.empty()) {
      cli::PrintUsage(argv[0], std::cout);
      return 1;
    }
    return cli::Run(*options, std::cout, std::cerr);

  } catch (const storage::StorageError& e) {
    std::cerr << "Storage error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
