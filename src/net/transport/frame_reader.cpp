// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/transport/frame_reader.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "net/transport/checked_data.h"

#include <string>

namespace net::transport {

namespace {

/// Offset of the length field inside the header.
constexpr size_t LENGTH_OFFSET = 4 + COMMAND_SIZE;

} // anonymous namespace

FrameReader::FrameReader() {
    buf_.reserve(INITIAL_BUF_CAPACITY);
}

void FrameReader::feed(std::span<const uint8_t> data) {
    if (failed_) return;
    buf_.insert(buf_.end(), data.begin(), data.end());
}

std::optional<FrameReader::Item> FrameReader::next() {
    if (failed_ || buf_.size() < MESSAGE_HEADER_SIZE) {
        return std::nullopt;
    }

    core::SpanReader header{std::span<const uint8_t>(buf_)};
    header.seek(LENGTH_OFFSET);
    uint32_t length = core::ser_read_u32(header);

    if (length > MAX_PAYLOAD_SIZE) {
        failed_ = true;
        EnvelopeError err;
        err.kind = EnvelopeErrorKind::BAD_LENGTH;
        auto name = CommandString::deserialize(
            std::span<const uint8_t>(buf_).subspan(4));
        if (name.ok()) err.command = std::move(name).value();
        err.cause = core::Error(core::ErrorCode::PARSE_OVERFLOW,
            "declared payload length " + std::to_string(length)
            + " exceeds maximum " + std::to_string(MAX_PAYLOAD_SIZE));
        LOG_DEBUG(core::LogCategory::NET,
                  "frame reader failed: " + err.format());
        buf_.clear();
        return Item{std::move(err)};
    }

    size_t total = MESSAGE_HEADER_SIZE + length;
    if (buf_.size() < total) {
        return std::nullopt;
    }

    Item item = decode_message(
        std::span<const uint8_t>(buf_.data(), total));

    buf_.erase(buf_.begin(), buf_.begin() + static_cast<ptrdiff_t>(total));

    // Shrink back after a large frame.
    if (buf_.capacity() > INITIAL_BUF_CAPACITY * 4 &&
        buf_.size() < INITIAL_BUF_CAPACITY) {
        buf_.shrink_to_fit();
        buf_.reserve(INITIAL_BUF_CAPACITY);
    }

    return item;
}

void FrameReader::reset() {
    buf_.clear();
    failed_ = false;
}

} // namespace net::transport
