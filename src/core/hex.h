#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes. Returns nullopt if the input is
// invalid (odd length or non-hex characters).
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Like from_hex, but skips ASCII whitespace and an optional leading "0x",
// so that hex dumps pasted from logs or packet captures decode as-is.
std::optional<std::vector<uint8_t>> parse_hex_dump(std::string_view text);

// Check whether a string is a valid hexadecimal encoding (even length,
// every character in [0-9a-fA-F]).
bool is_hex(std::string_view str);

}  // namespace core
