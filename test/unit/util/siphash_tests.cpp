// Copyright (c) 2016-present The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license.

#include <catch2/catch_test_macros.hpp>

#include "util/siphash.hpp"

#include <cstdint>
#include <vector>

using namespace shardnet::util;

/*
      SipHash-2-4 output with
      k = 00 01 02 ...
      and
      in = (empty string)
      in = 00 (1 byte)
      in = 00 01 (2 bytes)
      ...
      in = 00 01 02 ... 0f (16 bytes)
*/
static const uint64_t siphash_2_4_testvec[] = {
        0x726fdb47dd0e0e31, 0x74f839c593dc67fd, 0x0d6c8009d9a94f5a, 0x85676696d7fb7e2d,
        0xcf2794e0277187b7, 0x18765564cd99a68d, 0xcbc9466e58fee3ce, 0xab0200f58b01d137,
        0x93f5f5799a932462, 0x9e0082df0ba9e4b0, 0x7a5dbbc594ddb9f3, 0xf4b32f46226bada7,
        0x751e8fbc860ee5fb, 0x14ea5627c0843d90, 0xf723ca908e7af2ee, 0xa129ca6149be45e5,
        0x3f2acc7f57c29bdb,
};

static constexpr uint64_t K0 = 0x0706050403020100ULL;
static constexpr uint64_t K1 = 0x0F0E0D0C0B0A0908ULL;

TEST_CASE("SipHasher: reference vectors", "[siphash]") {
    std::vector<uint8_t> msg;
    for (size_t i = 0; i < std::size(siphash_2_4_testvec); ++i) {
        INFO("message length " << i);
        SipHasher hasher(K0, K1);
        hasher.Write(msg.data(), msg.size());
        REQUIRE(hasher.Finalize() == siphash_2_4_testvec[i]);
        msg.push_back(static_cast<uint8_t>(i));
    }
}

TEST_CASE("SipHasher: incremental writes", "[siphash]") {
    SipHasher hasher(K0, K1);
    REQUIRE(hasher.Finalize() == 0x726fdb47dd0e0e31ULL);

    const uint8_t t0[1] = {0};
    hasher.Write(t0, 1);
    REQUIRE(hasher.Finalize() == 0x74f839c593dc67fdULL);

    const uint8_t t1[7] = {1, 2, 3, 4, 5, 6, 7};
    hasher.Write(t1, 7);
    REQUIRE(hasher.Finalize() == 0x93f5f5799a932462ULL);

    const uint8_t t2[8] = {8, 9, 10, 11, 12, 13, 14, 15};
    hasher.Write(t2, 8);
    REQUIRE(hasher.Finalize() == 0x3f2acc7f57c29bdbULL);
}

TEST_CASE("SaltedHash: process key", "[siphash]") {
    std::array<uint8_t, 32> a{};
    std::array<uint8_t, 32> b{};
    b[31] = 1;

    SECTION("Deterministic within a process") {
        REQUIRE(SaltedHash(a) == SaltedHash(a));
        REQUIRE(&GetProcessSipKey() == &GetProcessSipKey());
    }

    SECTION("Different inputs hash differently") {
        REQUIRE(SaltedHash(a) != SaltedHash(b));
    }

    SECTION("Key is not the all-zero key") {
        const auto& key = GetProcessSipKey();
        REQUIRE((key[0] != 0 || key[1] != 0));
    }
}
