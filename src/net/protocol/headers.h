#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "net/protocol/blocks.h"
#include "primitives/block_header.h"

#include <cstdint>
#include <span>
#include <vector>

namespace net::protocol {

/// Maximum number of headers per HEADERS message.
inline constexpr size_t MAX_HEADERS = 2000;

/// 80-byte header + 1-byte zero transaction count.
inline constexpr size_t HEADER_ENTRY_SIZE = 81;

// ---------------------------------------------------------------------------
// HeadersMessage -- deliver block headers (HEADERS command)
// ---------------------------------------------------------------------------
// Each header is followed by a transaction count that must be zero; the
// message reuses the block layout without the transactions.
//
// Wire format:
//   count         compact_size
//   headers[]     [count]        (81 bytes each)
// ---------------------------------------------------------------------------
struct HeadersMessage {
    std::vector<primitives::BlockHeader> headers;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static core::Result<HeadersMessage> deserialize(
        std::span<const uint8_t> data);

    /// A full batch means the peer probably has more to send.
    [[nodiscard]] bool is_full() const noexcept {
        return headers.size() >= MAX_HEADERS;
    }

    bool operator==(const HeadersMessage&) const = default;
};

} // namespace net::protocol
