// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shardnet {
namespace util {

// Lowercase hex encoding.
std::string HexStr(std::span<const uint8_t> data);

// Decode hex (either case, no prefix, even length). nullopt on malformed input.
std::optional<std::vector<uint8_t>> ParseHex(std::string_view hex);

}  // namespace util
}  // namespace shardnet
