// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/transport/command.h"

#include <algorithm>
#include <stdexcept>

namespace net::transport {

CommandBytes CommandString::encode(std::string_view name) {
    if (!command_fits(name)) {
        throw std::length_error(
            "command name '" + std::string(name) + "' exceeds "
            + std::to_string(COMMAND_SIZE) + " bytes");
    }

    CommandBytes out{};
    std::copy(name.begin(), name.end(), out.begin());
    return out;
}

std::string CommandString::decode(
    std::span<const uint8_t, COMMAND_SIZE> tag) {
    auto end = std::find(tag.begin(), tag.end(), uint8_t{0});
    return std::string(tag.begin(), end);
}

core::Result<std::string> CommandString::deserialize(
    std::span<const uint8_t> data) {
    if (data.size() < COMMAND_SIZE) {
        return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
            "command field needs " + std::to_string(COMMAND_SIZE)
            + " bytes, got " + std::to_string(data.size()));
    }
    return decode(data.first<COMMAND_SIZE>());
}

} // namespace net::transport
