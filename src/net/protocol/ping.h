#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <span>
#include <vector>

namespace net::protocol {

/// A single 64-bit nonce.
inline constexpr size_t PING_PAYLOAD_SIZE = 8;

// ---------------------------------------------------------------------------
// PingMessage -- keepalive / latency probe (PING command)
// ---------------------------------------------------------------------------
// The receiver answers with a PONG echoing the nonce.  Pre-BIP31 empty
// pings are not accepted.
//
// Wire format:
//   nonce    uint64   (8 bytes LE)
// ---------------------------------------------------------------------------
struct PingMessage {
    uint64_t nonce = 0;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static core::Result<PingMessage> deserialize(
        std::span<const uint8_t> data);

    bool operator==(const PingMessage&) const = default;
};

// ---------------------------------------------------------------------------
// PongMessage -- response to a ping (PONG command), same layout
// ---------------------------------------------------------------------------
struct PongMessage {
    uint64_t nonce = 0;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static core::Result<PongMessage> deserialize(
        std::span<const uint8_t> data);

    [[nodiscard]] static PongMessage from_ping(const PingMessage& ping) noexcept {
        return PongMessage{ping.nonce};
    }

    bool operator==(const PongMessage&) const = default;
};

} // namespace net::protocol
