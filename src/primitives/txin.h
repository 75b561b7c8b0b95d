#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <vector>

#include "core/serialize.h"
#include "primitives/outpoint.h"

namespace primitives {

/// A transaction input: the output being spent, its unlocking script and,
/// for segwit spends, the witness stack.
struct TxInput {
    static constexpr uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;

    /// Smallest possible base encoding: outpoint, empty script, sequence.
    static constexpr size_t MIN_SERIALIZED_SIZE =
        OutPoint::SERIALIZED_SIZE + 1 + 4;

    OutPoint prevout;
    std::vector<uint8_t> script_sig;
    uint32_t sequence = SEQUENCE_FINAL;

    /// Segregated witness stack.  Carried here, but written by the
    /// transaction after all outputs (BIP144 layout).
    std::vector<std::vector<uint8_t>> witness;

    TxInput() = default;
    TxInput(OutPoint prevout_in, std::vector<uint8_t> script_sig_in,
            uint32_t sequence_in = SEQUENCE_FINAL);

    [[nodiscard]] bool has_witness() const { return !witness.empty(); }

    bool operator==(const TxInput&) const = default;

    /// Base input (no witness):
    ///   prevout (36) | compact_size(script_sig) | script_sig | sequence (4)
    template<typename Stream>
    void serialize(Stream& s) const {
        prevout.serialize(s);
        core::ser_write_vector(s, script_sig);
        core::ser_write_u32(s, sequence);
    }

    template<typename Stream>
    static TxInput deserialize(Stream& s) {
        TxInput input;
        input.prevout = OutPoint::deserialize(s);
        input.script_sig = core::ser_read_vector(s);
        input.sequence = core::ser_read_u32(s);
        return input;
    }
};

} // namespace primitives
