// Copyright (c) 2016-present The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace shardnet {
namespace util {

// SipHash-2-4 keyed hash. Used to hash peer-supplied identifiers (peer ids,
// request hashes) in hash tables so that remote peers cannot force bucket
// collisions.
class SipHasher {
public:
  SipHasher(uint64_t k0, uint64_t k1);

  SipHasher& Write(const uint8_t* data, size_t len);

  // Compute the 64-bit SipHash-2-4. Object remains untouched.
  uint64_t Finalize() const;

private:
  static constexpr uint64_t C0{0x736f6d6570736575ULL};
  static constexpr uint64_t C1{0x646f72616e646f6dULL};
  static constexpr uint64_t C2{0x6c7967656e657261ULL};
  static constexpr uint64_t C3{0x7465646279746573ULL};

  std::array<uint64_t, 4> v_;
  uint64_t tmp_{0};
  uint8_t count_{0};  // Only low 8 bits of input size matter
};

// Random 128-bit key generated once per process.
const std::array<uint64_t, 2>& GetProcessSipKey();

// SipHash of a fixed-width byte array under the process key.
template <size_t N>
uint64_t SaltedHash(const std::array<uint8_t, N>& bytes) {
  const auto& key = GetProcessSipKey();
  return SipHasher(key[0], key[1]).Write(bytes.data(), bytes.size()).Finalize();
}

}  // namespace util
}  // namespace shardnet
