// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/protocol/inventory.h"

#include "core/serialize.h"
#include "core/stream.h"

#include <stdexcept>

namespace net::protocol {

const char* inv_type_name(InvType type) noexcept {
    switch (type) {
        case InvType::ERROR:          return "ERROR";
        case InvType::TX:             return "TX";
        case InvType::BLOCK:          return "BLOCK";
        case InvType::FILTERED_BLOCK: return "FILTERED_BLOCK";
        case InvType::CMPCT_BLOCK:    return "CMPCT_BLOCK";
        case InvType::WITNESS_TX:     return "WITNESS_TX";
        case InvType::WITNESS_BLOCK:  return "WITNESS_BLOCK";
    }
    return "UNKNOWN";
}

// ===========================================================================
// InvItem
// ===========================================================================

std::string InvItem::to_string() const {
    return std::string(inv_type_name(type)) + "(" + hash.to_hex() + ")";
}

template <typename Stream>
void InvItem::serialize_to(Stream& s) const {
    core::ser_write_u32(s, static_cast<uint32_t>(type));
    core::ser_write_uint256(s, hash);
}

template <typename Stream>
InvItem InvItem::deserialize_from(Stream& s) {
    InvItem item;
    item.type = static_cast<InvType>(core::ser_read_u32(s));
    item.hash = core::ser_read_uint256(s);
    return item;
}

template void InvItem::serialize_to<core::DataStream>(core::DataStream&) const;
template InvItem InvItem::deserialize_from<core::SpanReader>(core::SpanReader&);

// ===========================================================================
// InventoryMessage<Tag>
// ===========================================================================

template <typename Tag>
std::vector<uint8_t> InventoryMessage<Tag>::serialize() const {
    core::DataStream stream;
    stream.reserve(5 + items.size() * INV_ITEM_SIZE);

    core::ser_write_compact_size(stream, items.size());
    for (const auto& item : items) {
        item.serialize_to(stream);
    }

    return stream.release();
}

template <typename Tag>
core::Result<InventoryMessage<Tag>> InventoryMessage<Tag>::deserialize(
    std::span<const uint8_t> data) {
    const std::string name = Tag::NAME;
    try {
        core::SpanReader reader{data};
        InventoryMessage msg;

        uint64_t count = core::ser_read_compact_size(reader);
        if (count > MAX_INV_ITEMS) {
            return core::Error(core::ErrorCode::PARSE_OVERFLOW,
                name + " item count " + std::to_string(count)
                + " exceeds MAX_INV_ITEMS (" + std::to_string(MAX_INV_ITEMS) + ")");
        }

        size_t needed = static_cast<size_t>(count) * INV_ITEM_SIZE;
        if (reader.remaining() < needed) {
            return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                name + ": declared " + std::to_string(count)
                + " items but only " + std::to_string(reader.remaining())
                + " bytes remain (need " + std::to_string(needed) + ")");
        }

        msg.items.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            msg.items.push_back(InvItem::deserialize_from(reader));
        }

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

template struct InventoryMessage<InvTag>;
template struct InventoryMessage<GetDataTag>;
template struct InventoryMessage<NotFoundTag>;

} // namespace net::protocol
