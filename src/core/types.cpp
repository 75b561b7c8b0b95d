// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <algorithm>
#include <stdexcept>

namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Returns -1 on invalid input.
constexpr int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

// ===========================================================================
// Blob<N>
// ===========================================================================

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }

    constexpr std::size_t EXPECTED_HEX_LEN = N * 2;
    if (hex.size() > EXPECTED_HEX_LEN) {
        throw std::invalid_argument(
            "Blob::from_hex: input too long (expected at most " +
            std::to_string(EXPECTED_HEX_LEN) + " hex chars)");
    }

    // Parse into display order, right-aligned, then reverse into storage.
    std::array<uint8_t, N> be_bytes{};
    const std::size_t pad = EXPECTED_HEX_LEN - hex.size();

    for (std::size_t i = 0; i < hex.size(); ++i) {
        int v = hex_digit_value(hex[i]);
        if (v < 0) {
            throw std::invalid_argument(
                "Blob::from_hex: invalid hex character");
        }
        std::size_t full_pos = pad + i;
        std::size_t byte_idx = full_pos / 2;
        if (full_pos % 2 == 0) {
            be_bytes[byte_idx] = static_cast<uint8_t>(v << 4);
        } else {
            be_bytes[byte_idx] |= static_cast<uint8_t>(v);
        }
    }

    Blob<N> result;
    std::reverse_copy(be_bytes.begin(), be_bytes.end(),
                      result.bytes_.begin());
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    std::string out;
    out.reserve(N * 2);
    for (std::size_t i = N; i > 0; --i) {
        uint8_t byte = bytes_[i - 1];
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    for (auto b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

template <std::size_t N>
std::strong_ordering Blob<N>::operator<=>(const Blob& other) const noexcept {
    // Most-significant byte is the last one in storage.
    for (std::size_t i = N; i > 0; --i) {
        if (bytes_[i - 1] != other.bytes_[i - 1]) {
            return bytes_[i - 1] < other.bytes_[i - 1]
                       ? std::strong_ordering::less
                       : std::strong_ordering::greater;
        }
    }
    return std::strong_ordering::equal;
}

template <std::size_t N>
bool Blob<N>::operator==(const Blob& other) const noexcept {
    return bytes_ == other.bytes_;
}

template class Blob<32>;

// ===========================================================================
// uint256
// ===========================================================================

uint256 uint256::from_hex(std::string_view hex) {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_hex(hex);
    return result;
}

uint256 uint256::from_bytes(
    std::span<const uint8_t, 32> bytes) noexcept {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_bytes(bytes);
    return result;
}

}  // namespace core
