// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/params.h"

#include <array>
#include <string>

namespace net {

namespace {

constexpr std::array<NetworkParams, 4> NETWORKS = {{
    {Network::MAIN,    "main",    0xd9b4bef9, 8333},
    {Network::TESTNET, "test",    0x0709110b, 18333},
    {Network::REGTEST, "regtest", 0xdab5bffa, 18444},
    {Network::SIGNET,  "signet",  0x40cf030a, 38333},
}};

static_assert(NETWORKS[static_cast<size_t>(Network::SIGNET)].network ==
              Network::SIGNET);

} // anonymous namespace

const NetworkParams& NetworkParams::get(Network net) noexcept {
    return NETWORKS[static_cast<size_t>(net)];
}

uint32_t network_magic(Network net) noexcept {
    return NetworkParams::get(net).magic;
}

std::string_view network_name(Network net) noexcept {
    return NetworkParams::get(net).name;
}

core::Result<Network> network_from_name(std::string_view name) {
    if (name == "mainnet") return Network::MAIN;
    if (name == "testnet") return Network::TESTNET;
    for (const auto& p : NETWORKS) {
        if (p.name == name) return p.network;
    }
    return core::Error(core::ErrorCode::NETWORK_UNKNOWN,
                       "unknown network '" + std::string(name) + "'");
}

std::optional<Network> network_from_magic(uint32_t magic) noexcept {
    for (const auto& p : NETWORKS) {
        if (p.magic == magic) return p.network;
    }
    return std::nullopt;
}

} // namespace net
