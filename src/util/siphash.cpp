// Copyright (c) 2016-present The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license.

#include "util/siphash.hpp"

#include <bit>
#include <random>

namespace shardnet {
namespace util {

namespace {

inline void SipRound(uint64_t& v0, uint64_t& v1, uint64_t& v2, uint64_t& v3) {
  v0 += v1;
  v1 = std::rotl(v1, 13);
  v1 ^= v0;
  v0 = std::rotl(v0, 32);
  v2 += v3;
  v3 = std::rotl(v3, 16);
  v3 ^= v2;
  v0 += v3;
  v3 = std::rotl(v3, 21);
  v3 ^= v0;
  v2 += v1;
  v1 = std::rotl(v1, 17);
  v1 ^= v2;
  v2 = std::rotl(v2, 32);
}

}  // namespace

SipHasher::SipHasher(uint64_t k0, uint64_t k1) : v_{C0 ^ k0, C1 ^ k1, C2 ^ k0, C3 ^ k1} {}

SipHasher& SipHasher::Write(const uint8_t* data, size_t len) {
  uint64_t v0 = v_[0], v1 = v_[1], v2 = v_[2], v3 = v_[3];
  uint64_t t = tmp_;
  uint8_t c = count_;

  for (size_t i = 0; i < len; ++i) {
    t |= static_cast<uint64_t>(data[i]) << (8 * (c % 8));
    c++;
    if ((c & 7) == 0) {
      v3 ^= t;
      SipRound(v0, v1, v2, v3);
      SipRound(v0, v1, v2, v3);
      v0 ^= t;
      t = 0;
    }
  }

  v_ = {v0, v1, v2, v3};
  count_ = c;
  tmp_ = t;
  return *this;
}

uint64_t SipHasher::Finalize() const {
  uint64_t v0 = v_[0], v1 = v_[1], v2 = v_[2], v3 = v_[3];
  uint64_t t = tmp_ | (static_cast<uint64_t>(count_) << 56);

  v3 ^= t;
  SipRound(v0, v1, v2, v3);
  SipRound(v0, v1, v2, v3);
  v0 ^= t;
  v2 ^= 0xFF;
  for (int i = 0; i < 4; ++i) {
    SipRound(v0, v1, v2, v3);
  }
  return v0 ^ v1 ^ v2 ^ v3;
}

const std::array<uint64_t, 2>& GetProcessSipKey() {
  static const std::array<uint64_t, 2> key = [] {
    std::random_device rd;
    std::uniform_int_distribution<uint64_t> dis;
    return std::array<uint64_t, 2>{dis(rd), dis(rd)};
  }();
  return key;
}

}  // namespace util
}  // namespace shardnet
