// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/protocol/addr.h"

#include "core/serialize.h"
#include "core/stream.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace net::protocol {

// ===========================================================================
// NetAddress
// ===========================================================================

NetAddress NetAddress::from_ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d,
                                 uint16_t port, uint64_t services) {
    NetAddress addr;
    addr.services = services;
    std::copy(IPV4_MAPPED_PREFIX.begin(), IPV4_MAPPED_PREFIX.end(),
              addr.ip.begin());
    addr.ip[12] = a;
    addr.ip[13] = b;
    addr.ip[14] = c;
    addr.ip[15] = d;
    addr.port = port;
    return addr;
}

template <typename Stream>
void NetAddress::serialize_to(Stream& s) const {
    core::ser_write_u64(s, services);
    core::ser_write_bytes(s, std::span<const uint8_t>(ip.data(), ip.size()));
    // One of the few big-endian fields in the protocol.
    core::ser_write_u16_be(s, port);
}

template <typename Stream>
NetAddress NetAddress::deserialize_from(Stream& s) {
    NetAddress addr;
    addr.services = core::ser_read_u64(s);
    core::ser_read_bytes(s, std::span<uint8_t>(addr.ip.data(), addr.ip.size()));
    addr.port = core::ser_read_u16_be(s);
    return addr;
}

template void NetAddress::serialize_to<core::DataStream>(core::DataStream&) const;
template NetAddress NetAddress::deserialize_from<core::SpanReader>(core::SpanReader&);

bool NetAddress::is_ipv4() const noexcept {
    return std::equal(IPV4_MAPPED_PREFIX.begin(), IPV4_MAPPED_PREFIX.end(),
                      ip.begin());
}

std::string NetAddress::to_string() const {
    std::string result;

    if (is_ipv4()) {
        result += std::to_string(ip[12]) + "."
                + std::to_string(ip[13]) + "."
                + std::to_string(ip[14]) + "."
                + std::to_string(ip[15]);
    } else {
        // Full groups, no "::" compression.
        result += "[";
        for (int i = 0; i < 16; i += 2) {
            if (i > 0) result += ":";
            unsigned group = (static_cast<unsigned>(ip[i]) << 8) | ip[i + 1];
            char buf[8];
            std::snprintf(buf, sizeof(buf), "%x", group);
            result += buf;
        }
        result += "]";
    }

    result += ":" + std::to_string(port);
    return result;
}

// ===========================================================================
// AddressEntry
// ===========================================================================

template <typename Stream>
void AddressEntry::serialize_to(Stream& s) const {
    core::ser_write_u32(s, timestamp);
    address.serialize_to(s);
}

template <typename Stream>
AddressEntry AddressEntry::deserialize_from(Stream& s) {
    AddressEntry entry;
    entry.timestamp = core::ser_read_u32(s);
    entry.address = NetAddress::deserialize_from(s);
    return entry;
}

template void AddressEntry::serialize_to<core::DataStream>(core::DataStream&) const;
template AddressEntry AddressEntry::deserialize_from<core::SpanReader>(core::SpanReader&);

// ===========================================================================
// AddrMessage
// ===========================================================================

std::vector<uint8_t> AddrMessage::serialize() const {
    core::DataStream stream;
    stream.reserve(5 + addresses.size() * ADDR_ENTRY_SIZE);

    core::ser_write_compact_size(stream, addresses.size());
    for (const auto& entry : addresses) {
        entry.serialize_to(stream);
    }

    return stream.release();
}

core::Result<AddrMessage> AddrMessage::deserialize(
    std::span<const uint8_t> data) {
    try {
        core::SpanReader reader{data};
        AddrMessage msg;

        uint64_t count = core::ser_read_compact_size(reader);
        if (count > MAX_ADDR_ENTRIES) {
            return core::Error(core::ErrorCode::PARSE_OVERFLOW,
                "AddrMessage address count " + std::to_string(count)
                + " exceeds MAX_ADDR_ENTRIES ("
                + std::to_string(MAX_ADDR_ENTRIES) + ")");
        }

        size_t needed = static_cast<size_t>(count) * ADDR_ENTRY_SIZE;
        if (reader.remaining() < needed) {
            return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                "AddrMessage: declared " + std::to_string(count)
                + " entries but only " + std::to_string(reader.remaining())
                + " bytes remain (need " + std::to_string(needed) + ")");
        }

        msg.addresses.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            msg.addresses.push_back(AddressEntry::deserialize_from(reader));
        }

        if (!reader.eof()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                "AddrMessage: " + std::to_string(reader.remaining())
                + " trailing bytes");
        }
        return msg;
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
            std::string("Failed to deserialize AddrMessage: ") + e.what());
    }
}

} // namespace net::protocol
