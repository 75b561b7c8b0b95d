#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Network parameters relevant to the wire envelope
// ---------------------------------------------------------------------------
// Every frame starts with a 4-byte magic value identifying the network it
// belongs to.  The magic is carried as a uint32 and written little-endian,
// so mainnet's 0xd9b4bef9 appears on the wire as f9 be b4 d9.
// ---------------------------------------------------------------------------

#include "core/error.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace net {

enum class Network : uint8_t {
    MAIN,
    TESTNET,
    REGTEST,
    SIGNET,
};

struct NetworkParams {
    Network          network;
    std::string_view name;
    uint32_t         magic;
    uint16_t         default_port;

    /// Returns the parameters for @p net.
    static const NetworkParams& get(Network net) noexcept;
};

[[nodiscard]] uint32_t network_magic(Network net) noexcept;

/// "main", "test", "regtest" or "signet".
[[nodiscard]] std::string_view network_name(Network net) noexcept;

/// Accepts the canonical names plus "mainnet" and "testnet".
[[nodiscard]] core::Result<Network> network_from_name(std::string_view name);

[[nodiscard]] std::optional<Network> network_from_magic(
    uint32_t magic) noexcept;

} // namespace net
