// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Routing primitives

 - FixedHash<Tag>: 32-byte value type, one instantiation per meaning
   (CryptoHash, PeerId, EpochId) so they cannot be mixed up.
 - AnnounceAccount: signed claim that an account is hosted by a peer during an
   epoch. Produced and verified upstream; immutable here.
 - PeerIdOrHash: routing target. A PeerId routes over the next-hop table,
   a CryptoHash routes back along the path a request came in on.
 - NextHopTable: destination -> first hops on some shortest path. Shared as
   an immutable snapshot.
*/

#include "util/siphash.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace shardnet {
namespace network {

template <typename Tag>
class FixedHash {
public:
  static constexpr size_t SIZE = 32;

  FixedHash() { data_.fill(0); }
  explicit FixedHash(const std::array<uint8_t, SIZE>& data) : data_(data) {}

  // Parse 64 hex characters. nullopt on anything else.
  static std::optional<FixedHash> FromHex(std::string_view hex);

  // Build from raw bytes. Shorter input is zero-padded, longer input truncated.
  static FixedHash FromBytes(std::span<const uint8_t> bytes) {
    FixedHash h;
    const size_t n = bytes.size() < SIZE ? bytes.size() : SIZE;
    for (size_t i = 0; i < n; ++i) {
      h.data_[i] = bytes[i];
    }
    return h;
  }

  std::string GetHex() const;

  // Abbreviated hex for log lines.
  std::string ToString() const { return GetHex().substr(0, 12); }

  bool IsNull() const {
    for (uint8_t b : data_) {
      if (b != 0) return false;
    }
    return true;
  }

  const std::array<uint8_t, SIZE>& bytes() const { return data_; }
  const uint8_t* data() const { return data_.data(); }

  auto operator<=>(const FixedHash&) const = default;

private:
  std::array<uint8_t, SIZE> data_;
};

struct CryptoHashTag {};
struct PeerIdTag {};
struct EpochIdTag {};

using CryptoHash = FixedHash<CryptoHashTag>;
// Node public key, opaque to routing.
using PeerId = FixedHash<PeerIdTag>;
using EpochId = FixedHash<EpochIdTag>;
using AccountId = std::string;

// Salted hasher for peer-supplied ids in hash containers.
struct FixedHashHasher {
  template <typename Tag>
  size_t operator()(const FixedHash<Tag>& h) const {
    return static_cast<size_t>(util::SaltedHash(h.bytes()));
  }
};

struct AnnounceAccount {
  AccountId account_id;
  PeerId peer_id;
  EpochId epoch_id;
  std::vector<uint8_t> signature;

  bool operator==(const AnnounceAccount&) const = default;
};

using PeerIdOrHash = std::variant<PeerId, CryptoHash>;

using NextHopTable = std::unordered_map<PeerId, std::vector<PeerId>, FixedHashHasher>;

// JSON encoding: hashes as lowercase hex strings.
template <typename Tag>
void to_json(nlohmann::json& j, const FixedHash<Tag>& h);
template <typename Tag>
void from_json(const nlohmann::json& j, FixedHash<Tag>& h);

void to_json(nlohmann::json& j, const AnnounceAccount& aa);
void from_json(const nlohmann::json& j, AnnounceAccount& aa);

}  // namespace network
}  // namespace shardnet
