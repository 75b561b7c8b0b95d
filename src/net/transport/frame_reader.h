#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/transport/message.h"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace net::transport {

// ---------------------------------------------------------------------------
// FrameReader -- splits a byte stream into envelopes
// ---------------------------------------------------------------------------
// Received bytes are appended with feed().  next() yields nothing until a
// whole frame (24-byte header plus declared payload) is buffered, then
// decodes and consumes it.  A frame that fails to decode is still consumed,
// so the caller may keep reading; a declared length above MAX_PAYLOAD_SIZE
// cannot be skipped and puts the reader into the failed state, after which
// next() yields nothing.
// ---------------------------------------------------------------------------
class FrameReader {
public:
    using Item = core::Result<RawNetworkMessage, EnvelopeError>;

    FrameReader();

    void feed(std::span<const uint8_t> data);

    [[nodiscard]] std::optional<Item> next();

    [[nodiscard]] bool failed() const noexcept { return failed_; }

    /// Bytes buffered but not yet consumed.
    [[nodiscard]] size_t buffered() const noexcept { return buf_.size(); }

    /// Drop all buffered bytes and clear the failed state.
    void reset();

private:
    static constexpr size_t INITIAL_BUF_CAPACITY = 64 * 1024;

    std::vector<uint8_t> buf_;
    bool                 failed_ = false;
};

} // namespace net::transport
