// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/protocol/ping.h"

#include "core/serialize.h"
#include "core/stream.h"

#include <string>

namespace net::protocol {

namespace {

std::vector<uint8_t> encode_nonce(uint64_t nonce) {
    std::vector<uint8_t> out;
    out.reserve(PING_PAYLOAD_SIZE);
    core::VectorWriter writer(out);
    core::ser_write_u64(writer, nonce);
    return out;
}

core::Result<uint64_t> decode_nonce(std::span<const uint8_t> data,
                                    const char* name) {
    if (data.size() != PING_PAYLOAD_SIZE) {
        return core::Error(
            data.size() < PING_PAYLOAD_SIZE
                ? core::ErrorCode::PARSE_UNDERFLOW
                : core::ErrorCode::PARSE_BAD_FORMAT,
            std::string(name) + " payload must be "
            + std::to_string(PING_PAYLOAD_SIZE) + " bytes, got "
            + std::to_string(data.size()));
    }
    core::SpanReader reader{data};
    return core::ser_read_u64(reader);
}

} // anonymous namespace

std::vector<uint8_t> PingMessage::serialize() const {
    return encode_nonce(nonce);
}

core::Result<PingMessage> PingMessage::deserialize(
    std::span<const uint8_t> data) {
    uint64_t nonce = SATWIRE_TRY(decode_nonce(data, "PingMessage"));
    return PingMessage{nonce};
}

std::vector<uint8_t> PongMessage::serialize() const {
    return encode_nonce(nonce);
}

core::Result<PongMessage> PongMessage::deserialize(
    std::span<const uint8_t> data) {
    uint64_t nonce = SATWIRE_TRY(decode_nonce(data, "PongMessage"));
    return PongMessage{nonce};
}

} // namespace net::protocol
