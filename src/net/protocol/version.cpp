// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/protocol/version.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"

#include <cstdio>
#include <stdexcept>

namespace net::protocol {

std::string service_flags_to_string(uint64_t flags) {
    if (flags == NODE_NONE) {
        return "NONE";
    }

    std::string result;

    auto append = [&](std::string_view name) {
        if (!result.empty()) {
            result += " | ";
        }
        result += name;
    };

    if (flags & NODE_NETWORK)         append("NODE_NETWORK");
    if (flags & NODE_BLOOM)           append("NODE_BLOOM");
    if (flags & NODE_WITNESS)         append("NODE_WITNESS");
    if (flags & NODE_COMPACT_FILTERS) append("NODE_COMPACT_FILTERS");
    if (flags & NODE_NETWORK_LIMITED) append("NODE_NETWORK_LIMITED");

    uint64_t known_mask = NODE_NETWORK | NODE_BLOOM | NODE_WITNESS
                        | NODE_COMPACT_FILTERS | NODE_NETWORK_LIMITED;
    uint64_t unknown = flags & ~known_mask;
    if (unknown != 0) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "UNKNOWN(0x%llx)",
                      static_cast<unsigned long long>(unknown));
        append(buf);
    }

    return result;
}

// ===========================================================================
// VersionMessage
// ===========================================================================

std::vector<uint8_t> VersionMessage::serialize() const {
    core::DataStream stream;
    stream.reserve(min_payload_size() + user_agent.size() + 5);

    core::ser_write_i32(stream, version);
    core::ser_write_u64(stream, services);
    core::ser_write_i64(stream, timestamp);
    addr_recv.serialize_to(stream);
    addr_from.serialize_to(stream);
    core::ser_write_u64(stream, nonce);
    core::ser_write_string(stream, user_agent);
    core::ser_write_i32(stream, start_height);
    if (relay.has_value()) {
        core::ser_write_bool(stream, *relay);
    }

    return stream.release();
}

core::Result<VersionMessage> VersionMessage::deserialize(
    std::span<const uint8_t> data) {
    try {
        if (data.size() < min_payload_size()) {
            return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                "VersionMessage payload too short: "
                + std::to_string(data.size()) + " bytes (min "
                + std::to_string(min_payload_size()) + ")");
        }

        core::SpanReader reader{data};
        VersionMessage msg;

        msg.version   = core::ser_read_i32(reader);
        msg.services  = core::ser_read_u64(reader);
        msg.timestamp = core::ser_read_i64(reader);
        msg.addr_recv = NetAddress::deserialize_from(reader);
        msg.addr_from = NetAddress::deserialize_from(reader);
        msg.nonce     = core::ser_read_u64(reader);

        uint64_t ua_len = core::ser_read_compact_size(reader);
        if (ua_len > MAX_USER_AGENT_LENGTH) {
            return core::Error(core::ErrorCode::PARSE_OVERFLOW,
                "VersionMessage user_agent length " + std::to_string(ua_len)
                + " exceeds MAX_USER_AGENT_LENGTH ("
                + std::to_string(MAX_USER_AGENT_LENGTH) + ")");
        }
        auto ua = reader.take(static_cast<size_t>(ua_len));
        msg.user_agent.assign(ua.begin(), ua.end());

        msg.start_height = core::ser_read_i32(reader);

        if (!reader.eof()) {
            msg.relay = core::ser_read_bool(reader);
            if (!reader.eof()) {
                LOG_TRACE(core::LogCategory::P2P,
                          "version: ignoring " + std::to_string(
                              reader.remaining()) + " extension bytes");
            }
        } else {
            msg.relay = std::nullopt;
        }

        return msg;
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
            std::string("Failed to deserialize VersionMessage: ") + e.what());
    }
}

bool VersionMessage::has_service(ServiceFlags flag) const noexcept {
    return (services & static_cast<uint64_t>(flag)) != 0;
}

// ===========================================================================
// VerackMessage
// ===========================================================================

std::vector<uint8_t> VerackMessage::serialize() const {
    return {};
}

core::Result<VerackMessage> VerackMessage::deserialize(
    std::span<const uint8_t> data) {
    if (!data.empty()) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
            "VerackMessage must have empty payload, got "
            + std::to_string(data.size()) + " bytes");
    }
    return VerackMessage{};
}

} // namespace net::protocol
