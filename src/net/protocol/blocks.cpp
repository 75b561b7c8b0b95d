// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/protocol/blocks.h"

#include "core/serialize.h"
#include "core/stream.h"

#include <stdexcept>
#include <string>

namespace net::protocol {

// ===========================================================================
// LocatorRequest<Tag>
// ===========================================================================

template <typename Tag>
std::vector<uint8_t> LocatorRequest<Tag>::serialize() const {
    core::DataStream stream;
    stream.reserve(4 + 9 + locator_hashes.size() * 32 + 32);

    core::ser_write_u32(stream, version);
    core::ser_write_compact_size(stream, locator_hashes.size());
    for (const auto& hash : locator_hashes) {
        core::ser_write_uint256(stream, hash);
    }
    core::ser_write_uint256(stream, hash_stop);

    return stream.release();
}

template <typename Tag>
core::Result<LocatorRequest<Tag>> LocatorRequest<Tag>::deserialize(
    std::span<const uint8_t> data) {
    const std::string name = Tag::NAME;
    try {
        // version (4) + compact_size(0) (1) + hash_stop (32)
        if (data.size() < 37) {
            return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                name + " payload too short: "
                + std::to_string(data.size()) + " bytes (min 37)");
        }

        core::SpanReader reader{data};
        LocatorRequest msg;

        msg.version = core::ser_read_u32(reader);

        uint64_t count = core::ser_read_compact_size(reader);
        if (count > MAX_LOCATOR_HASHES) {
            return core::Error(core::ErrorCode::PARSE_OVERFLOW,
                name + " locator count " + std::to_string(count)
                + " exceeds MAX_LOCATOR_HASHES ("
                + std::to_string(MAX_LOCATOR_HASHES) + ")");
        }

        size_t needed = static_cast<size_t>(count) * 32 + 32;
        if (reader.remaining() < needed) {
            return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                name + ": insufficient data for "
                + std::to_string(count) + " locator hashes plus hash_stop");
        }

        msg.locator_hashes.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            msg.locator_hashes.push_back(core::ser_read_uint256(reader));
        }
        msg.hash_stop = core::ser_read_uint256(reader);

        if (!reader.eof()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                name + ": " + std::to_string(reader.remaining())
                + " trailing bytes");
        }
        return msg;
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
            "Failed to deserialize " + name + ": " + e.what());
    }
}

template struct LocatorRequest<GetBlocksTag>;
template struct LocatorRequest<GetHeadersTag>;

// ===========================================================================
// BlockMessage
// ===========================================================================

std::vector<uint8_t> BlockMessage::serialize() const {
    return block.serialize();
}

core::Result<BlockMessage> BlockMessage::deserialize(
    std::span<const uint8_t> data) {
    if (data.size() > MAX_BLOCK_SERIALIZED_SIZE) {
        return core::Error(core::ErrorCode::PARSE_OVERFLOW,
            "BlockMessage payload exceeds MAX_BLOCK_SERIALIZED_SIZE ("
            + std::to_string(MAX_BLOCK_SERIALIZED_SIZE) + " bytes), got "
            + std::to_string(data.size()));
    }

    // header (80) + compact_size(0) (1)
    if (data.size() < primitives::BlockHeader::SERIALIZED_SIZE + 1) {
        return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
            "BlockMessage payload too short for a block: "
            + std::to_string(data.size()) + " bytes (min 81)");
    }

    auto block_result = primitives::Block::deserialize(data);
    if (!block_result.ok()) {
        return core::Error(block_result.error().code(),
            "Failed to deserialize BlockMessage: "
            + block_result.error().message());
    }

    BlockMessage msg;
    msg.block = std::move(block_result).value();
    return msg;
}

} // namespace net::protocol
