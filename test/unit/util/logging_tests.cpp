// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for LogManager

#include <catch2/catch_test_macros.hpp>

#include "util/logging.hpp"

#include <thread>
#include <vector>

using namespace shardnet::util;

// LogManager::Initialize() runs once per process; these tests only rely on
// behavior that holds after the first call.

TEST_CASE("LogManager: component loggers", "[logging]") {
    LogManager::Initialize("off", false, "");

    SECTION("Default logger") {
        auto logger = LogManager::GetLogger();
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "default");
    }

    SECTION("Network and storage loggers") {
        REQUIRE(LogManager::GetLogger("network")->name() == "network");
        REQUIRE(LogManager::GetLogger("storage")->name() == "storage");
    }

    SECTION("Unknown component falls back to default") {
        REQUIRE(LogManager::GetLogger("nonexistent")->name() == "default");
    }

    SECTION("Same logger for same component") {
        REQUIRE(LogManager::GetLogger("network").get() == LogManager::GetLogger("network").get());
    }
}

TEST_CASE("LogManager: levels", "[logging]") {
    LogManager::Initialize("off", false, "");

    SECTION("SetLogLevel applies to every component") {
        LogManager::SetLogLevel("debug");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::debug);
        REQUIRE(LogManager::GetLogger("network")->level() == spdlog::level::debug);
        REQUIRE(LogManager::GetLogger("storage")->level() == spdlog::level::debug);
    }

    SECTION("SetComponentLevel applies to one component") {
        LogManager::SetLogLevel("off");
        LogManager::SetComponentLevel("network", "trace");
        REQUIRE(LogManager::GetLogger("network")->level() == spdlog::level::trace);
        REQUIRE(LogManager::GetLogger("storage")->level() == spdlog::level::off);
    }

    SECTION("Unknown component is ignored") {
        LogManager::SetLogLevel("warn");
        LogManager::SetComponentLevel("nonexistent", "trace");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::warn);
    }

    LogManager::SetLogLevel("off");
}

TEST_CASE("LogManager: macros from many threads", "[logging]") {
    LogManager::Initialize("off", false, "");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 100; ++i) {
                LOG_NET_DEBUG("thread {} message {}", t, i);
                LOG_STORAGE_TRACE("thread {} message {}", t, i);
                LOG_NET_WARN_RL("rate limited {}", i);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    SUCCEED();
}
