// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for loading routing configuration overrides

#include <catch2/catch_test_macros.hpp>

#include "common/routing_test_util.hpp"
#include "network/routing_config.hpp"

using namespace shardnet;
using namespace shardnet::network;
using shardnet::test::TempDir;

namespace {

std::string WriteConfig(const TempDir& dir, const std::string& contents) {
    auto path = dir.path() / "routing.json";
    test::WriteTextFile(path, contents);
    return path.string();
}

}  // namespace

TEST_CASE("RoutingConfig: defaults", "[network][config][unit]") {
    RoutingConfig config;
    REQUIRE(config.announce_cache_size == DEFAULT_ANNOUNCE_ACCOUNT_CACHE_SIZE);
    REQUIRE(config.route_back_capacity == DEFAULT_ROUTE_BACK_CACHE_SIZE);
    REQUIRE(config.route_back_ttl == std::chrono::seconds(120));
    REQUIRE(config.last_routed_cache_size == DEFAULT_LAST_ROUTED_CACHE_SIZE);
}

TEST_CASE("RoutingConfig: loading overrides", "[network][config][unit]") {
    TempDir dir("shardnet_config");
    RoutingConfig config;

    SECTION("All keys") {
        auto path = WriteConfig(dir, R"({"announce_cache_size": 5, "route_back_capacity": 6,
                                         "route_back_ttl_secs": 7, "last_routed_cache_size": 8})");
        REQUIRE(LoadRoutingConfig(path, config));
        CHECK(config.announce_cache_size == 5);
        CHECK(config.route_back_capacity == 6);
        CHECK(config.route_back_ttl == std::chrono::seconds(7));
        CHECK(config.last_routed_cache_size == 8);
    }

    SECTION("Missing keys keep current values, unknown keys ignored") {
        config.route_back_capacity = 42;
        auto path = WriteConfig(dir, R"({"route_back_ttl_secs": 30, "something_else": true})");
        REQUIRE(LoadRoutingConfig(path, config));
        CHECK(config.route_back_ttl == std::chrono::seconds(30));
        CHECK(config.route_back_capacity == 42);
        CHECK(config.announce_cache_size == DEFAULT_ANNOUNCE_ACCOUNT_CACHE_SIZE);
    }

    SECTION("Rejected files leave the config untouched") {
        const char* bad_files[] = {
                "not json",
                "[1, 2, 3]",
                R"({"announce_cache_size": 0})",
                R"({"route_back_ttl_secs": -5})",
                R"({"route_back_capacity": "many"})",
                R"({"announce_cache_size": 3, "last_routed_cache_size": 0})",
        };
        for (const char* contents : bad_files) {
            INFO(contents);
            auto path = WriteConfig(dir, contents);
            REQUIRE_FALSE(LoadRoutingConfig(path, config));
            CHECK(config.announce_cache_size == DEFAULT_ANNOUNCE_ACCOUNT_CACHE_SIZE);
            CHECK(config.route_back_ttl == DEFAULT_ROUTE_BACK_TTL);
            CHECK(config.last_routed_cache_size == DEFAULT_LAST_ROUTED_CACHE_SIZE);
        }
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(LoadRoutingConfig((dir.path() / "absent.json").string(), config));
    }
}
