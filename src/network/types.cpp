// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/types.hpp"

#include "util/hex.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

namespace shardnet {
namespace network {

template <typename Tag>
std::optional<FixedHash<Tag>> FixedHash<Tag>::FromHex(std::string_view hex) {
  if (hex.size() != SIZE * 2) {
    return std::nullopt;
  }
  auto bytes = util::ParseHex(hex);
  if (!bytes) {
    return std::nullopt;
  }
  return FromBytes(*bytes);
}

template <typename Tag>
std::string FixedHash<Tag>::GetHex() const {
  return util::HexStr(data_);
}

template <typename Tag>
void to_json(nlohmann::json& j, const FixedHash<Tag>& h) {
  j = h.GetHex();
}

template <typename Tag>
void from_json(const nlohmann::json& j, FixedHash<Tag>& h) {
  auto parsed = FixedHash<Tag>::FromHex(j.get<std::string>());
  if (!parsed) {
    throw std::invalid_argument("expected 64 hex characters");
  }
  h = *parsed;
}

template class FixedHash<CryptoHashTag>;
template class FixedHash<PeerIdTag>;
template class FixedHash<EpochIdTag>;

template void to_json(nlohmann::json&, const CryptoHash&);
template void to_json(nlohmann::json&, const PeerId&);
template void to_json(nlohmann::json&, const EpochId&);
template void from_json(const nlohmann::json&, CryptoHash&);
template void from_json(const nlohmann::json&, PeerId&);
template void from_json(const nlohmann::json&, EpochId&);

void to_json(nlohmann::json& j, const AnnounceAccount& aa) {
  j = nlohmann::json{{"account_id", aa.account_id},
                     {"peer_id", aa.peer_id.GetHex()},
                     {"epoch_id", aa.epoch_id.GetHex()},
                     {"signature", util::HexStr(aa.signature)}};
}

void from_json(const nlohmann::json& j, AnnounceAccount& aa) {
  j.at("account_id").get_to(aa.account_id);
  aa.peer_id = j.at("peer_id").get<PeerId>();
  aa.epoch_id = j.at("epoch_id").get<EpochId>();

  auto signature = util::ParseHex(j.value("signature", std::string()));
  if (!signature) {
    throw std::invalid_argument("signature is not valid hex");
  }
  aa.signature = std::move(*signature);
}

}  // namespace network
}  // namespace shardnet
