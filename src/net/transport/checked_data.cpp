// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/transport/checked_data.h"

#include "core/hex.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "crypto/sha256.h"

#include <algorithm>
#include <string>

namespace net::transport {

Checksum compute_checksum(std::span<const uint8_t> payload) {
    crypto::Sha256Hasher hasher;
    hasher.write(payload);
    crypto::Sha256Digest digest = hasher.finalize_double();
    Checksum out;
    std::copy_n(digest.begin(), out.size(), out.begin());
    return out;
}

void frame_into(std::vector<uint8_t>& out, std::span<const uint8_t> payload) {
    out.reserve(out.size() + CHECKED_HEADER_SIZE + payload.size());
    core::VectorWriter writer(out);
    core::ser_write_u32(writer, static_cast<uint32_t>(payload.size()));
    Checksum sum = compute_checksum(payload);
    core::ser_write_bytes(writer, std::span<const uint8_t>(sum));
    core::ser_write_bytes(writer, payload);
}

std::vector<uint8_t> frame(std::span<const uint8_t> payload) {
    std::vector<uint8_t> out;
    frame_into(out, payload);
    return out;
}

core::Result<std::vector<uint8_t>> unframe(core::SpanReader& reader) {
    if (reader.remaining() < CHECKED_HEADER_SIZE) {
        return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
            "checked data header needs "
            + std::to_string(CHECKED_HEADER_SIZE) + " bytes, got "
            + std::to_string(reader.remaining()));
    }

    uint32_t length = core::ser_read_u32(reader);
    Checksum expected;
    core::ser_read_bytes(reader, std::span<uint8_t>(expected));

    if (length > MAX_PAYLOAD_SIZE) {
        return core::Error(core::ErrorCode::PARSE_OVERFLOW,
            "payload length " + std::to_string(length)
            + " exceeds maximum " + std::to_string(MAX_PAYLOAD_SIZE));
    }
    if (reader.remaining() < length) {
        return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
            "payload declares " + std::to_string(length)
            + " bytes, only " + std::to_string(reader.remaining())
            + " available");
    }

    std::span<const uint8_t> payload = reader.take(length);
    Checksum actual = compute_checksum(payload);
    if (actual != expected) {
        LOG_TRACE(core::LogCategory::NET,
                  "checksum mismatch: header=" + core::to_hex(expected)
                  + " computed=" + core::to_hex(actual));
        return core::Error(core::ErrorCode::PARSE_BAD_CHECKSUM,
            "checksum mismatch: expected " + core::to_hex(expected)
            + ", computed " + core::to_hex(actual));
    }

    return std::vector<uint8_t>(payload.begin(), payload.end());
}

} // namespace net::transport
