// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/protocol/headers.h"

#include "core/serialize.h"
#include "core/stream.h"

#include <stdexcept>
#include <string>

namespace net::protocol {

std::vector<uint8_t> HeadersMessage::serialize() const {
    core::DataStream stream;
    stream.reserve(5 + headers.size() * HEADER_ENTRY_SIZE);

    core::ser_write_compact_size(stream, headers.size());
    for (const auto& header : headers) {
        header.serialize(stream);
        core::ser_write_compact_size(stream, 0);
    }

    return stream.release();
}

core::Result<HeadersMessage> HeadersMessage::deserialize(
    std::span<const uint8_t> data) {
    try {
        core::SpanReader reader{data};
        HeadersMessage msg;

        uint64_t count = core::ser_read_compact_size(reader);
        if (count > MAX_HEADERS) {
            return core::Error(core::ErrorCode::PARSE_OVERFLOW,
                "HeadersMessage header count " + std::to_string(count)
                + " exceeds MAX_HEADERS (" + std::to_string(MAX_HEADERS) + ")");
        }

        size_t needed = static_cast<size_t>(count) * HEADER_ENTRY_SIZE;
        if (reader.remaining() < needed) {
            return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                "HeadersMessage: declared " + std::to_string(count)
                + " headers but only " + std::to_string(reader.remaining())
                + " bytes remain (need " + std::to_string(needed) + ")");
        }

        msg.headers.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            msg.headers.push_back(primitives::BlockHeader::deserialize(reader));

            uint64_t tx_count = core::ser_read_compact_size(reader);
            if (tx_count != 0) {
                return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                    "HeadersMessage: non-zero transaction count ("
                    + std::to_string(tx_count) + ") after header at index "
                    + std::to_string(i));
            }
        }

        if (!reader.eof()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                "HeadersMessage: " + std::to_string(reader.remaining())
                + " trailing bytes");
        }
        return msg;
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
            std::string("Failed to deserialize HeadersMessage: ") + e.what());
    }
}

} // namespace net::protocol
