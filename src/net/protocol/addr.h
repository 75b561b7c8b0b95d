#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace net::protocol {

/// Maximum number of address entries per ADDR message.
inline constexpr size_t MAX_ADDR_ENTRIES = 1000;

/// services (8) + ip (16) + port (2).
inline constexpr size_t NET_ADDRESS_SIZE = 26;

/// timestamp (4) + NetAddress (26).
inline constexpr size_t ADDR_ENTRY_SIZE = 30;

/// IPv4-mapped IPv6 prefix ::ffff:0:0/96.  192.168.1.1 is stored as
///   00 00 00 00 00 00 00 00 00 00 FF FF C0 A8 01 01
inline constexpr std::array<uint8_t, 12> IPV4_MAPPED_PREFIX = {
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF
};

// ---------------------------------------------------------------------------
// NetAddress -- peer endpoint as carried in VERSION and ADDR
// ---------------------------------------------------------------------------
// Wire format:
//   services     uint64   (8 bytes LE)
//   ip           bytes    (16 bytes, IPv6 or IPv4-mapped)
//   port         uint16   (2 bytes BE / network byte order)
// ---------------------------------------------------------------------------
struct NetAddress {
    uint64_t                services = 0;
    std::array<uint8_t, 16> ip       = {};
    uint16_t                port     = 0;   // host byte order

    /// Build an IPv4-mapped address from dotted-quad octets.
    [[nodiscard]] static NetAddress from_ipv4(uint8_t a, uint8_t b,
                                              uint8_t c, uint8_t d,
                                              uint16_t port,
                                              uint64_t services = 0);

    template <typename Stream>
    void serialize_to(Stream& s) const;

    template <typename Stream>
    static NetAddress deserialize_from(Stream& s);

    [[nodiscard]] bool is_ipv4() const noexcept;

    /// "1.2.3.4:8333" or "[2001:db8:0:0:0:0:0:1]:8333".
    [[nodiscard]] std::string to_string() const;

    bool operator==(const NetAddress&) const = default;
};

// ---------------------------------------------------------------------------
// AddressEntry -- a NetAddress with its last-seen time (ADDR record)
// ---------------------------------------------------------------------------
struct AddressEntry {
    uint32_t   timestamp = 0;   // last-seen time (Unix epoch)
    NetAddress address;

    template <typename Stream>
    void serialize_to(Stream& s) const;

    template <typename Stream>
    static AddressEntry deserialize_from(Stream& s);

    bool operator==(const AddressEntry&) const = default;
};

// ---------------------------------------------------------------------------
// AddrMessage -- announce known peer addresses (ADDR command)
// ---------------------------------------------------------------------------
// Wire format:
//   count       compact_size
//   addresses   [count]       (30 bytes each)
// ---------------------------------------------------------------------------
struct AddrMessage {
    std::vector<AddressEntry> addresses;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static core::Result<AddrMessage> deserialize(
        std::span<const uint8_t> data);

    bool operator==(const AddrMessage&) const = default;
};

} // namespace net::protocol
