// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/block.h"

#include "core/serialize.h"
#include "core/stream.h"
#include "crypto/sha256.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace primitives {

Block::Block(BlockHeader header, std::vector<Transaction> txs)
    : header_(std::move(header))
    , txs_(std::move(txs)) {}

namespace {

core::uint256 compute_merkle(std::vector<core::uint256> hashes) {
    if (hashes.empty()) {
        return core::uint256{};
    }

    while (hashes.size() > 1) {
        if (hashes.size() % 2 != 0) {
            hashes.push_back(hashes.back());
        }

        std::vector<core::uint256> next_level;
        next_level.reserve(hashes.size() / 2);

        for (size_t i = 0; i < hashes.size(); i += 2) {
            uint8_t combined[64];
            std::memcpy(combined, hashes[i].data(), 32);
            std::memcpy(combined + 32, hashes[i + 1].data(), 32);
            next_level.push_back(crypto::hash256(
                std::span<const uint8_t>(combined, 64)));
        }

        hashes = std::move(next_level);
    }

    return hashes[0];
}

} // anonymous namespace

core::uint256 Block::compute_merkle_root() const {
    std::vector<core::uint256> leaves;
    leaves.reserve(txs_.size());
    for (const auto& tx : txs_) {
        leaves.push_back(tx.txid());
    }
    return compute_merkle(std::move(leaves));
}

bool Block::is_valid_merkle_root() const {
    return header_.merkle_root == compute_merkle_root();
}

std::vector<uint8_t> Block::serialize() const {
    core::DataStream s;
    header_.serialize(s);
    core::ser_write_compact_size(s, txs_.size());
    for (const auto& tx : txs_) {
        tx.serialize_to(s);
    }
    return s.release();
}

core::Result<Block> Block::deserialize(std::span<const uint8_t> data) {
    try {
        core::SpanReader reader(data);
        Block block;
        block.header_ = BlockHeader::deserialize(reader);

        size_t tx_count = core::ser_read_count(
            reader, core::MAX_VECTOR_SIZE, "Block transactions");
        block.txs_.reserve(std::min(
            tx_count, reader.remaining() / Transaction::MIN_SERIALIZED_SIZE));
        for (size_t i = 0; i < tx_count; ++i) {
            block.txs_.push_back(Transaction::deserialize_from(reader));
        }

        if (!reader.eof()) {
            return core::Error(
                core::ErrorCode::PARSE_BAD_FORMAT,
                "Block::deserialize: " +
                std::to_string(reader.remaining()) + " trailing bytes");
        }
        return block;

    } catch (const std::exception& e) {
        return core::Error(
            core::ErrorCode::PARSE_ERROR,
            std::string("Block::deserialize: ") + e.what());
    }
}

} // namespace primitives
