#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "primitives/transaction.h"

#include <cstdint>
#include <span>
#include <vector>

namespace net::protocol {

/// Largest transaction accepted in a TX message (standardness weight limit
/// of 400000 is a tighter bound; the codec only guards allocation).
inline constexpr size_t MAX_TX_MESSAGE_SIZE = 4'000'000;

// ---------------------------------------------------------------------------
// TxMessage -- a single transaction (TX command)
// ---------------------------------------------------------------------------
// BIP144 layout: when any input has witness data, marker 0x00 and flag 0x01
// follow the version and the witness stacks follow the outputs.
// ---------------------------------------------------------------------------
struct TxMessage {
    primitives::Transaction tx;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static core::Result<TxMessage> deserialize(
        std::span<const uint8_t> data);

    [[nodiscard]] const core::uint256& txid() const { return tx.txid(); }

    bool operator==(const TxMessage&) const = default;
};

} // namespace net::protocol
