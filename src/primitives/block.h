#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "primitives/block_header.h"
#include "primitives/transaction.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// Block -- a block header together with its transactions
// ---------------------------------------------------------------------------
class Block {
public:
    Block() = default;

    Block(BlockHeader header, std::vector<Transaction> txs);

    [[nodiscard]] const BlockHeader& header() const { return header_; }
    BlockHeader& header() { return header_; }

    [[nodiscard]] const std::vector<Transaction>& transactions() const {
        return txs_;
    }
    std::vector<Transaction>& transactions() { return txs_; }

    [[nodiscard]] core::uint256 hash() const { return header_.hash(); }

    /// Bitcoin-style binary merkle tree over the txids; an odd level
    /// duplicates its last hash.  Zero hash for an empty block.
    [[nodiscard]] core::uint256 compute_merkle_root() const;

    [[nodiscard]] bool is_valid_merkle_root() const;

    [[nodiscard]] size_t tx_count() const { return txs_.size(); }

    /// header | compact_size(tx count) | transactions
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /// Decode a buffer holding exactly one block.
    [[nodiscard]] static core::Result<Block> deserialize(
        std::span<const uint8_t> data);

    bool operator==(const Block&) const = default;

private:
    BlockHeader header_;
    std::vector<Transaction> txs_;
};

} // namespace primitives
