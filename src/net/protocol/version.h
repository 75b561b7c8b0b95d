#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "net/protocol/addr.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace net::protocol {

// ---------------------------------------------------------------------------
// Service flag bits advertised in VERSION and ADDR
// ---------------------------------------------------------------------------
enum ServiceFlags : uint64_t {
    NODE_NONE              = 0,
    NODE_NETWORK           = (1 << 0),
    NODE_BLOOM             = (1 << 2),   // BIP111
    NODE_WITNESS           = (1 << 3),   // BIP144
    NODE_COMPACT_FILTERS   = (1 << 6),   // BIP157/158
    NODE_NETWORK_LIMITED   = (1 << 10),  // BIP159
};

/// "NODE_NETWORK | NODE_WITNESS", "NONE", with unknown bits in hex.
[[nodiscard]] std::string service_flags_to_string(uint64_t flags);

inline constexpr int32_t PROTOCOL_VERSION = 70015;

/// Maximum length of the user_agent string (BIP14).
inline constexpr size_t MAX_USER_AGENT_LENGTH = 256;

// ---------------------------------------------------------------------------
// VersionMessage -- exchanged during the initial handshake
// ---------------------------------------------------------------------------
// Layout on the wire (little-endian unless noted):
//
//   version               int32    (4 bytes)
//   services              uint64   (8 bytes)
//   timestamp             int64    (8 bytes)
//   addr_recv             NetAddress (26 bytes, port big-endian)
//   addr_from             NetAddress (26 bytes, port big-endian)
//   nonce                 uint64   (8 bytes)
//   user_agent            var_str  (compact-size + bytes)
//   start_height          int32    (4 bytes)
//   relay                 bool     (1 byte, optional -- BIP37)
//
// Newer peers may append further fields; they are accepted and dropped.
// ---------------------------------------------------------------------------
struct VersionMessage {
    int32_t    version   = PROTOCOL_VERSION;
    uint64_t   services  = NODE_NETWORK | NODE_WITNESS;
    int64_t    timestamp = 0;
    NetAddress addr_recv;
    NetAddress addr_from;
    uint64_t   nonce        = 0;
    std::string user_agent  = "/Satwire:0.1.0/";
    int32_t    start_height = 0;

    /// Absent on the wire for pre-BIP37 peers; written only when set.
    std::optional<bool> relay = true;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static core::Result<VersionMessage> deserialize(
        std::span<const uint8_t> data);

    [[nodiscard]] bool has_service(ServiceFlags flag) const noexcept;

    /// Everything through start_height with an empty user agent.
    [[nodiscard]] static constexpr size_t min_payload_size() noexcept {
        return 4 + 8 + 8 + NET_ADDRESS_SIZE * 2 + 8 + 1 + 4;
    }

    bool operator==(const VersionMessage&) const = default;
};

// ---------------------------------------------------------------------------
// VerackMessage -- acknowledgement of a version message (empty payload)
// ---------------------------------------------------------------------------
struct VerackMessage {
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /// Rejects any payload bytes.
    [[nodiscard]] static core::Result<VerackMessage> deserialize(
        std::span<const uint8_t> data);

    bool operator==(const VerackMessage&) const = default;
};

} // namespace net::protocol
