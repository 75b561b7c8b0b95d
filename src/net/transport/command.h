#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// CommandString -- the 12-byte command field of a frame header
// ---------------------------------------------------------------------------
// The name is left-justified and right-padded with zero bytes.  Decoding
// stops at the first zero byte: anything after it is ignored, and bytes
// before it are passed through without ASCII validation.
// ---------------------------------------------------------------------------

#include "core/error.h"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace net::transport {

inline constexpr size_t COMMAND_SIZE = 12;

using CommandBytes = std::array<uint8_t, COMMAND_SIZE>;

struct CommandString {
    /// Zero-pad @p name into 12 bytes.  Throws std::length_error when the
    /// name is longer than 12 bytes.
    [[nodiscard]] static CommandBytes encode(std::string_view name);

    /// Prefix of @p tag up to (not including) the first zero byte.
    [[nodiscard]] static std::string decode(
        std::span<const uint8_t, COMMAND_SIZE> tag);

    /// Decode the first 12 bytes of @p data.  PARSE_UNDERFLOW when fewer
    /// than 12 bytes are available.
    [[nodiscard]] static core::Result<std::string> deserialize(
        std::span<const uint8_t> data);
};

/// True when @p name fits in the command field.
[[nodiscard]] constexpr bool command_fits(std::string_view name) noexcept {
    return name.size() <= COMMAND_SIZE;
}

} // namespace net::transport
