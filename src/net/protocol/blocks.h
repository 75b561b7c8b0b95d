#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "primitives/block.h"

#include <cstdint>
#include <span>
#include <vector>

namespace net::protocol {

/// Maximum number of block hashes in a locator (getblocks / getheaders).
inline constexpr size_t MAX_LOCATOR_HASHES = 101;

/// Largest serialized block accepted in a BLOCK message (BIP141 limit).
inline constexpr size_t MAX_BLOCK_SERIALIZED_SIZE = 4'000'000;

// ---------------------------------------------------------------------------
// LocatorRequest<Tag> -- "send me what follows this locator"
// ---------------------------------------------------------------------------
// GETBLOCKS answers with an INV of block hashes, GETHEADERS with a HEADERS
// message; the request payload is identical.
//
// Wire format:
//   version          uint32       (4 bytes)
//   hash_count       compact_size
//   locator_hashes   [hash_count] uint256 (32 bytes each)
//   hash_stop        uint256      (32 bytes, zero = as many as allowed)
// ---------------------------------------------------------------------------
template <typename Tag>
struct LocatorRequest {
    uint32_t version = 70015;
    std::vector<core::uint256> locator_hashes;
    core::uint256 hash_stop;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static core::Result<LocatorRequest> deserialize(
        std::span<const uint8_t> data);

    [[nodiscard]] bool requests_maximum() const noexcept {
        return hash_stop.is_zero();
    }

    bool operator==(const LocatorRequest&) const = default;
};

struct GetBlocksTag  { static constexpr const char* NAME = "GetBlocksMessage"; };
struct GetHeadersTag { static constexpr const char* NAME = "GetHeadersMessage"; };

using GetBlocksMessage  = LocatorRequest<GetBlocksTag>;
using GetHeadersMessage = LocatorRequest<GetHeadersTag>;

extern template struct LocatorRequest<GetBlocksTag>;
extern template struct LocatorRequest<GetHeadersTag>;

// ---------------------------------------------------------------------------
// BlockMessage -- a full block (BLOCK command)
// ---------------------------------------------------------------------------
struct BlockMessage {
    primitives::Block block;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static core::Result<BlockMessage> deserialize(
        std::span<const uint8_t> data);

    [[nodiscard]] core::uint256 hash() const { return block.hash(); }

    bool operator==(const BlockMessage&) const = default;
};

} // namespace net::protocol
