#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/serialize.h"
#include "core/types.h"
#include "primitives/outpoint.h"
#include "primitives/txin.h"
#include "primitives/txout.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// Transaction -- Bitcoin transaction with cached hashes
// ---------------------------------------------------------------------------
// Supports the BIP144 (segregated witness) serialization format.  Hashes are
// SHA-256d of the respective encodings.
// ---------------------------------------------------------------------------
class Transaction {
public:
    /// version, input count, output count, locktime.
    static constexpr size_t MIN_SERIALIZED_SIZE = 4 + 1 + 1 + 4;

    Transaction() = default;

    Transaction(std::vector<TxInput> vin, std::vector<TxOutput> vout,
                int32_t version = 2, uint32_t locktime = 0);

    // -- Const accessors ----------------------------------------------------

    [[nodiscard]] int32_t version() const { return version_; }
    [[nodiscard]] const std::vector<TxInput>& vin() const { return vin_; }
    [[nodiscard]] const std::vector<TxOutput>& vout() const { return vout_; }
    [[nodiscard]] uint32_t locktime() const { return locktime_; }

    // -- Mutable access for construction ------------------------------------

    std::vector<TxInput>& vin() { invalidate_cache(); return vin_; }
    std::vector<TxOutput>& vout() { invalidate_cache(); return vout_; }
    void set_version(int32_t v) { version_ = v; invalidate_cache(); }
    void set_locktime(uint32_t lt) { locktime_ = lt; invalidate_cache(); }

    // -- Hashes (cached, lazily computed) ------------------------------------

    /// SHA-256d of the non-witness serialization.
    [[nodiscard]] const core::uint256& txid() const;

    /// SHA-256d of the full serialization; equals txid() without witness.
    [[nodiscard]] const core::uint256& wtxid() const;

    [[nodiscard]] bool is_coinbase() const;
    [[nodiscard]] bool has_witness() const;

    // -- Serialization (BIP144 segwit format) --------------------------------

    /// Segwit format when any input carries witness data.  Throws
    /// std::invalid_argument without inputs: the zero input count would
    /// read back as the BIP144 marker.
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /// Hashing form; accepts a transaction without inputs.
    [[nodiscard]] std::vector<uint8_t> serialize_no_witness() const;

    template <typename Stream>
    void serialize_to(Stream& s) const;

    template <typename Stream>
    void serialize_no_witness_to(Stream& s) const;

    /// Read one transaction from @p s.  Throws std::runtime_error on
    /// malformed input; used when a transaction is embedded in a larger
    /// structure (blocks).
    template <typename Stream>
    static Transaction deserialize_from(Stream& s);

    /// Decode a buffer holding exactly one transaction.
    [[nodiscard]] static core::Result<Transaction> deserialize(
        std::span<const uint8_t> data);

    /// Field-wise equality; cached hashes are not compared.
    [[nodiscard]] bool operator==(const Transaction& o) const;

private:
    int32_t version_ = 2;
    std::vector<TxInput> vin_;
    std::vector<TxOutput> vout_;
    uint32_t locktime_ = 0;

    mutable core::uint256 txid_cache_;
    mutable core::uint256 wtxid_cache_;
    mutable bool txid_cached_ = false;
    mutable bool wtxid_cached_ = false;

    void invalidate_cache();
};

// =========================================================================
// Template implementations
// =========================================================================

template <typename Stream>
void Transaction::serialize_to(Stream& s) const {
    if (vin_.empty()) {
        throw std::invalid_argument(
            "Transaction: cannot serialize without inputs");
    }
    const bool use_witness = has_witness();

    core::ser_write_i32(s, version_);

    if (use_witness) {
        // BIP144 marker + flag
        core::ser_write_u8(s, 0x00);
        core::ser_write_u8(s, 0x01);
    }

    core::ser_write_obj_vector(s, vin_);
    core::ser_write_obj_vector(s, vout_);

    if (use_witness) {
        for (const auto& input : vin_) {
            core::ser_write_compact_size(s, input.witness.size());
            for (const auto& item : input.witness) {
                core::ser_write_vector(s, item);
            }
        }
    }

    core::ser_write_u32(s, locktime_);
}

template <typename Stream>
void Transaction::serialize_no_witness_to(Stream& s) const {
    core::ser_write_i32(s, version_);
    core::ser_write_obj_vector(s, vin_);
    core::ser_write_obj_vector(s, vout_);
    core::ser_write_u32(s, locktime_);
}

template <typename Stream>
Transaction Transaction::deserialize_from(Stream& s) {
    Transaction tx;
    tx.version_ = core::ser_read_i32(s);

    // A zero where the input count belongs is the BIP144 marker; the flag
    // byte must follow.  Otherwise rewind and read the count.
    bool has_witness_data = false;
    size_t pos_before_marker = s.tell();
    uint8_t marker = core::ser_read_u8(s);
    if (marker == 0x00) {
        uint8_t flag = core::ser_read_u8(s);
        if (flag != 0x01) {
            throw std::runtime_error(
                "Transaction: unknown segwit flag " + std::to_string(flag));
        }
        has_witness_data = true;
    } else {
        s.seek(pos_before_marker);
    }

    tx.vin_ = core::ser_read_obj_vector<TxInput>(
        s, core::MAX_VECTOR_SIZE, TxInput::MIN_SERIALIZED_SIZE,
        "Transaction inputs");
    tx.vout_ = core::ser_read_obj_vector<TxOutput>(
        s, core::MAX_VECTOR_SIZE, TxOutput::MIN_SERIALIZED_SIZE,
        "Transaction outputs");

    if (has_witness_data) {
        for (auto& input : tx.vin_) {
            size_t items = core::ser_read_count(
                s, core::MAX_VECTOR_SIZE, "Transaction witness items");
            input.witness.reserve(std::min(items, s.remaining()));
            for (size_t j = 0; j < items; ++j) {
                input.witness.push_back(core::ser_read_vector(s));
            }
        }
        // A witness flag with only empty stacks would not re-encode to
        // the same bytes.
        if (!tx.has_witness()) {
            throw std::runtime_error(
                "Transaction: superfluous witness record");
        }
    }

    tx.locktime_ = core::ser_read_u32(s);
    return tx;
}

} // namespace primitives
