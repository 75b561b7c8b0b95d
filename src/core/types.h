#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size byte array (little-endian internal storage)
// ---------------------------------------------------------------------------
// Bytes are stored exactly as they appear on the wire (index 0 first).
// Hex display uses the reversed order, matching the conventional way
// block and transaction hashes are printed.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    /// Default: zero-initialized.
    constexpr Blob() noexcept : bytes_{} {}

    /// Construct from a raw wire-order byte span.
    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse a hex string in display order (up to 2*N hex chars, shorter
    /// input is left-padded with zeros).  Accepts an optional "0x" prefix.
    /// Throws std::invalid_argument on malformed input.
    static Blob from_hex(std::string_view hex);

    /// Display-order hex string (2*N lower-case hex chars, no prefix).
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    [[nodiscard]] bool is_zero() const noexcept;

    // -- Comparison (numeric, as big unsigned integers) ----------------------

    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept;
    [[nodiscard]] bool operator==(const Blob& other) const noexcept;

protected:
    std::array<uint8_t, N> bytes_;
};

// ---------------------------------------------------------------------------
// uint256 -- 32-byte hash (block hashes, txids, inventory identifiers)
// ---------------------------------------------------------------------------
class uint256 : public Blob<32> {
public:
    using Blob<32>::Blob;

    // Re-expose static factories returning uint256 (not Blob<32>).
    static uint256 from_hex(std::string_view hex);
    static uint256 from_bytes(std::span<const uint8_t, 32> bytes) noexcept;
};

}  // namespace core
