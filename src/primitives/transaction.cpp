// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.h"

#include "core/stream.h"
#include "crypto/sha256.h"

#include <string>
#include <utility>

namespace primitives {

Transaction::Transaction(std::vector<TxInput> vin,
                         std::vector<TxOutput> vout,
                         int32_t version,
                         uint32_t locktime)
    : version_(version)
    , vin_(std::move(vin))
    , vout_(std::move(vout))
    , locktime_(locktime) {}

// =========================================================================
// Cache management
// =========================================================================

void Transaction::invalidate_cache() {
    txid_cached_ = false;
    wtxid_cached_ = false;
}

const core::uint256& Transaction::txid() const {
    if (!txid_cached_) {
        txid_cache_ = crypto::hash256(serialize_no_witness());
        txid_cached_ = true;
    }
    return txid_cache_;
}

const core::uint256& Transaction::wtxid() const {
    if (!wtxid_cached_) {
        wtxid_cache_ = has_witness() ? crypto::hash256(serialize())
                                     : txid();
        wtxid_cached_ = true;
    }
    return wtxid_cache_;
}

// =========================================================================
// Properties
// =========================================================================

bool Transaction::is_coinbase() const {
    return vin_.size() == 1 && vin_[0].prevout.is_null();
}

bool Transaction::has_witness() const {
    for (const auto& input : vin_) {
        if (input.has_witness()) {
            return true;
        }
    }
    return false;
}

bool Transaction::operator==(const Transaction& o) const {
    return version_  == o.version_
        && vin_      == o.vin_
        && vout_     == o.vout_
        && locktime_ == o.locktime_;
}

// =========================================================================
// Serialization
// =========================================================================

std::vector<uint8_t> Transaction::serialize() const {
    core::DataStream s;
    serialize_to(s);
    return s.release();
}

std::vector<uint8_t> Transaction::serialize_no_witness() const {
    core::DataStream s;
    serialize_no_witness_to(s);
    return s.release();
}

core::Result<Transaction> Transaction::deserialize(
    std::span<const uint8_t> data) {
    try {
        core::SpanReader reader(data);
        Transaction tx = deserialize_from(reader);
        if (!reader.eof()) {
            return core::Error(
                core::ErrorCode::PARSE_BAD_FORMAT,
                "Transaction::deserialize: " +
                std::to_string(reader.remaining()) + " trailing bytes");
        }
        return tx;
    } catch (const std::exception& e) {
        return core::Error(
            core::ErrorCode::PARSE_ERROR,
            std::string("Transaction::deserialize: ") + e.what());
    }
}

} // namespace primitives
