#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <string>

#include "core/serialize.h"
#include "core/types.h"

namespace primitives {

/// Identifies a particular output of a previous transaction by its hash and
/// index within that transaction's output list.
struct OutPoint {
    static constexpr size_t SERIALIZED_SIZE = 36;

    core::uint256 txid;

    /// 0xFFFFFFFF together with a zero txid marks a coinbase input.
    uint32_t n = 0xFFFFFFFF;

    OutPoint() = default;
    OutPoint(const core::uint256& txid_in, uint32_t n_in)
        : txid(txid_in), n(n_in) {}

    [[nodiscard]] bool is_null() const {
        return txid.is_zero() && n == 0xFFFFFFFF;
    }

    bool operator==(const OutPoint&) const = default;

    /// "<txid_hex>:<index>".
    [[nodiscard]] std::string to_string() const;

    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_uint256(s, txid);
        core::ser_write_u32(s, n);
    }

    template<typename Stream>
    static OutPoint deserialize(Stream& s) {
        OutPoint op;
        op.txid = core::ser_read_uint256(s);
        op.n = core::ser_read_u32(s);
        return op;
    }
};

} // namespace primitives
