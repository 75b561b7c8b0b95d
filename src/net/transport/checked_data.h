#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// CheckedData -- length-prefixed, checksummed payload
// ---------------------------------------------------------------------------
// Wire format (little-endian):
//   Offset  Size  Field
//   0       4     length    (bytes of payload)
//   4       4     checksum  (first 4 bytes of SHA-256d of payload)
//   8       N     payload   (N == length)
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "core/stream.h"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace net::transport {

/// Length field plus checksum.
inline constexpr size_t CHECKED_HEADER_SIZE = 8;

/// Maximum accepted payload length (32 MiB).
inline constexpr size_t MAX_PAYLOAD_SIZE = 32 * 1024 * 1024;

using Checksum = std::array<uint8_t, 4>;

[[nodiscard]] Checksum compute_checksum(std::span<const uint8_t> payload);

/// Produce `length || checksum || payload`.
[[nodiscard]] std::vector<uint8_t> frame(std::span<const uint8_t> payload);

/// Append `length || checksum || payload` to @p out.
void frame_into(std::vector<uint8_t>& out, std::span<const uint8_t> payload);

/// Read one checked payload from @p reader and verify its checksum.
///
/// Errors:
///   PARSE_UNDERFLOW     fewer than 8 header bytes or `length` payload bytes
///   PARSE_OVERFLOW      length > MAX_PAYLOAD_SIZE
///   PARSE_BAD_CHECKSUM  checksum mismatch
///
/// On error the reader position is unspecified.
[[nodiscard]] core::Result<std::vector<uint8_t>> unframe(
    core::SpanReader& reader);

} // namespace net::transport
