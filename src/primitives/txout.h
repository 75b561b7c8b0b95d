#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <vector>

#include "core/serialize.h"

namespace primitives {

/// A transaction output: an amount in satoshis and the locking script
/// (scriptPubKey) that must be satisfied to spend it.
struct TxOutput {
    static constexpr size_t MIN_SERIALIZED_SIZE = 8 + 1;

    /// Amount in satoshis.  Carried as read from the wire; range checks
    /// belong to consensus validation, not to the codec.
    int64_t value = -1;

    std::vector<uint8_t> script_pubkey;

    TxOutput() = default;
    TxOutput(int64_t value_in, std::vector<uint8_t> script_in);

    /// The -1 sentinel marks an unset output.
    [[nodiscard]] bool is_null() const { return value == -1; }

    bool operator==(const TxOutput&) const = default;

    /// value (8) | compact_size(script) | script bytes
    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_i64(s, value);
        core::ser_write_vector(s, script_pubkey);
    }

    template<typename Stream>
    static TxOutput deserialize(Stream& s) {
        TxOutput output;
        output.value = core::ser_read_i64(s);
        output.script_pubkey = core::ser_read_vector(s);
        return output;
    }
};

} // namespace primitives
