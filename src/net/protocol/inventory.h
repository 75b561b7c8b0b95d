#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace net::protocol {

// ---------------------------------------------------------------------------
// Inventory item types used in INV, GETDATA, and NOTFOUND messages
// ---------------------------------------------------------------------------
// Values outside this list are carried through unchanged; deciding what to
// do with an unknown type is up to the receiver.
// ---------------------------------------------------------------------------
enum class InvType : uint32_t {
    ERROR          = 0,
    TX             = 1,
    BLOCK          = 2,
    FILTERED_BLOCK = 3,            // BIP37
    CMPCT_BLOCK    = 4,            // BIP152
    WITNESS_TX     = 0x40000001,   // BIP144
    WITNESS_BLOCK  = 0x40000002,   // BIP144
};

inline constexpr uint32_t INV_WITNESS_FLAG = 0x40000000;

/// Maximum number of inventory items per message.
inline constexpr size_t MAX_INV_ITEMS = 50000;

/// type (4) + hash (32).
inline constexpr size_t INV_ITEM_SIZE = 36;

[[nodiscard]] const char* inv_type_name(InvType type) noexcept;

[[nodiscard]] inline bool inv_is_witness(InvType type) noexcept {
    return (static_cast<uint32_t>(type) & INV_WITNESS_FLAG) != 0;
}

// ---------------------------------------------------------------------------
// InvItem -- a single inventory vector (type + hash)
// ---------------------------------------------------------------------------
struct InvItem {
    InvType       type = InvType::TX;
    core::uint256 hash;

    template <typename Stream>
    void serialize_to(Stream& s) const;

    template <typename Stream>
    static InvItem deserialize_from(Stream& s);

    /// "TYPE(hash_hex)".
    [[nodiscard]] std::string to_string() const;

    bool operator==(const InvItem&) const = default;
};

// ---------------------------------------------------------------------------
// InventoryMessage<Tag> -- a list of inventory vectors
// ---------------------------------------------------------------------------
// INV, GETDATA and NOTFOUND share one wire format but are distinct message
// kinds; the tag keeps them distinct types so that a GETDATA can never be
// sent where an INV was built.
//
// Wire format:
//   count    compact_size
//   items    [count]        (36 bytes each)
// ---------------------------------------------------------------------------
template <typename Tag>
struct InventoryMessage {
    std::vector<InvItem> items;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static core::Result<InventoryMessage> deserialize(
        std::span<const uint8_t> data);

    bool operator==(const InventoryMessage&) const = default;
};

struct InvTag      { static constexpr const char* NAME = "InvMessage"; };
struct GetDataTag  { static constexpr const char* NAME = "GetDataMessage"; };
struct NotFoundTag { static constexpr const char* NAME = "NotFoundMessage"; };

/// Announce objects the sender has.
using InvMessage      = InventoryMessage<InvTag>;
/// Request objects by inventory.
using GetDataMessage  = InventoryMessage<GetDataTag>;
/// Reply to GETDATA for objects the sender does not have.
using NotFoundMessage = InventoryMessage<NotFoundTag>;

extern template struct InventoryMessage<InvTag>;
extern template struct InventoryMessage<GetDataTag>;
extern template struct InventoryMessage<NotFoundTag>;

} // namespace net::protocol
