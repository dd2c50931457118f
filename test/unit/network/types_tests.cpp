// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for routing value types and their JSON encoding

#include <catch2/catch_test_macros.hpp>

#include "common/routing_test_util.hpp"
#include "network/types.hpp"

#include <unordered_set>

#include <nlohmann/json.hpp>

using namespace shardnet::network;
using shardnet::test::MakeAnnouncement;
using shardnet::test::MakePeer;
using json = nlohmann::json;

TEST_CASE("FixedHash: hex parsing", "[network][types][unit]") {
    const std::string hex = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";

    SECTION("Valid hex") {
        auto id = PeerId::FromHex(hex);
        REQUIRE(id.has_value());
        CHECK(id->bytes()[0] == 0x00);
        CHECK(id->bytes()[1] == 0x11);
        CHECK(id->bytes()[31] == 0xff);
        CHECK(id->GetHex() == hex);
        CHECK(id->ToString() == "001122334455");
    }

    SECTION("Uppercase is accepted and normalized") {
        std::string upper = "AABBCCDDEEFF00112233445566778899AABBCCDDEEFF00112233445566778899";
        auto id = PeerId::FromHex(upper);
        REQUIRE(id.has_value());
        CHECK(id->GetHex() == "aabbccddeeff00112233445566778899aabbccddeeff00112233445566778899");
    }

    SECTION("Invalid hex") {
        CHECK_FALSE(PeerId::FromHex("").has_value());
        CHECK_FALSE(PeerId::FromHex(hex.substr(2)).has_value());
        CHECK_FALSE(PeerId::FromHex(hex + "00").has_value());
        std::string bad = hex;
        bad[10] = 'g';
        CHECK_FALSE(PeerId::FromHex(bad).has_value());
    }
}

TEST_CASE("FixedHash: value semantics", "[network][types][unit]") {
    SECTION("Default is null") {
        PeerId id;
        CHECK(id.IsNull());
        CHECK_FALSE(MakePeer("x").IsNull());
    }

    SECTION("FromBytes pads and truncates") {
        std::vector<uint8_t> short_bytes = {1, 2, 3};
        auto padded = CryptoHash::FromBytes(short_bytes);
        CHECK(padded.bytes()[2] == 3);
        CHECK(padded.bytes()[3] == 0);

        std::vector<uint8_t> long_bytes(40, 0x7f);
        auto truncated = CryptoHash::FromBytes(long_bytes);
        CHECK(truncated.bytes()[31] == 0x7f);
    }

    SECTION("Ordering and equality") {
        CHECK(MakePeer("a") == MakePeer("a"));
        CHECK(MakePeer("a") != MakePeer("b"));
        CHECK(MakePeer("a") < MakePeer("b"));
    }

    SECTION("Hashed containers") {
        std::unordered_set<PeerId, FixedHashHasher> peers;
        peers.insert(MakePeer("a"));
        peers.insert(MakePeer("b"));
        peers.insert(MakePeer("a"));
        CHECK(peers.size() == 2);
        CHECK(FixedHashHasher{}(MakePeer("a")) == FixedHashHasher{}(MakePeer("a")));
    }

    SECTION("Routing target variant") {
        PeerIdOrHash target = MakePeer("a");
        CHECK(std::holds_alternative<PeerId>(target));
        target = shardnet::test::MakeHash("h");
        CHECK(std::holds_alternative<CryptoHash>(target));
    }
}

TEST_CASE("AnnounceAccount: JSON encoding", "[network][types][unit]") {
    auto aa = MakeAnnouncement("alice.near", "P1", "E1");

    SECTION("Fields are hex strings") {
        json j = aa;
        CHECK(j.at("account_id").get<std::string>() == "alice.near");
        CHECK(j.at("peer_id").get<std::string>() == aa.peer_id.GetHex());
        CHECK(j.at("epoch_id").get<std::string>() == aa.epoch_id.GetHex());
        CHECK(j.at("signature").get<std::string>() == "deadbeef");
        CHECK(j.get<AnnounceAccount>() == aa);
    }

    SECTION("Missing signature decodes as empty") {
        json j = aa;
        j.erase("signature");
        CHECK(j.get<AnnounceAccount>().signature.empty());
    }

    SECTION("Malformed fields are rejected") {
        json j = aa;
        j["peer_id"] = "abcd";
        CHECK_THROWS_AS(j.get<AnnounceAccount>(), std::invalid_argument);

        json k = aa;
        k["signature"] = "xyz";
        CHECK_THROWS_AS(k.get<AnnounceAccount>(), std::invalid_argument);

        json m = aa;
        m.erase("account_id");
        CHECK_THROWS_AS(m.get<AnnounceAccount>(), json::out_of_range);
    }
}
