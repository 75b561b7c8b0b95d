// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/protocol/transactions.h"

#include <string>

namespace net::protocol {

std::vector<uint8_t> TxMessage::serialize() const {
    return tx.serialize();
}

core::Result<TxMessage> TxMessage::deserialize(
    std::span<const uint8_t> data) {
    if (data.size() > MAX_TX_MESSAGE_SIZE) {
        return core::Error(core::ErrorCode::PARSE_OVERFLOW,
            "TxMessage payload exceeds MAX_TX_MESSAGE_SIZE ("
            + std::to_string(MAX_TX_MESSAGE_SIZE) + " bytes), got "
            + std::to_string(data.size()));
    }

    if (data.size() < primitives::Transaction::MIN_SERIALIZED_SIZE) {
        return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
            "TxMessage payload too short: "
            + std::to_string(data.size()) + " bytes (min "
            + std::to_string(primitives::Transaction::MIN_SERIALIZED_SIZE)
            + ")");
    }

    auto tx_result = primitives::Transaction::deserialize(data);
    if (!tx_result.ok()) {
        return core::Error(tx_result.error().code(),
            "Failed to deserialize TxMessage: "
            + tx_result.error().message());
    }

    TxMessage msg;
    msg.tx = std::move(tx_result).value();
    return msg;
}

} // namespace net::protocol
