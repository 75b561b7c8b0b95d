// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Envelope encoding and command dispatch.
//
// Decoding never throws on malformed input.  Each stage maps its failure
// onto an EnvelopeErrorKind and keeps the underlying core::Error as the
// cause, so a caller can tell a short read from a bad checksum from a
// payload the domain codec refused.
// ---------------------------------------------------------------------------

#include "net/transport/message.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "net/transport/checked_data.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace net::transport {

namespace {

using PayloadDecoder =
    core::Result<NetworkMessage> (*)(std::span<const uint8_t>);

template <typename T>
core::Result<NetworkMessage> decode_as(std::span<const uint8_t> payload) {
    auto result = T::deserialize(payload);
    if (!result.ok()) {
        return std::move(result).error();
    }
    return NetworkMessage{std::move(result).value()};
}

template <size_t... I>
constexpr std::array<PayloadDecoder, sizeof...(I)> make_decoders(
    std::index_sequence<I...>) {
    return {{&decode_as<std::variant_alternative_t<I, NetworkMessage>>...}};
}

/// Indexed by MessageKind.
constexpr auto PAYLOAD_DECODERS =
    make_decoders(std::make_index_sequence<MESSAGE_KIND_COUNT>{});

std::string hex32(uint32_t val) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%08x", val);
    return std::string(buf);
}

EnvelopeError make_envelope_error(EnvelopeErrorKind kind,
                                  std::string command,
                                  core::Error cause) {
    EnvelopeError err;
    err.kind    = kind;
    err.command = std::move(command);
    err.cause   = std::move(cause);
    LOG_DEBUG(core::LogCategory::NET, "decode failed: " + err.format());
    return err;
}

/// Map a CheckedData failure onto the envelope taxonomy.
EnvelopeErrorKind framing_error_kind(core::ErrorCode code) noexcept {
    switch (code) {
        case core::ErrorCode::PARSE_OVERFLOW:     return EnvelopeErrorKind::BAD_LENGTH;
        case core::ErrorCode::PARSE_BAD_CHECKSUM: return EnvelopeErrorKind::BAD_CHECKSUM;
        default:                                  return EnvelopeErrorKind::TRUNCATED;
    }
}

} // anonymous namespace

// ===================================================================
// Name table lookups
// ===================================================================

std::optional<MessageKind> kind_from_command(std::string_view name) noexcept {
    for (const auto& entry : COMMAND_TABLE) {
        if (entry.name == name) return entry.kind;
    }
    return std::nullopt;
}

bool is_reserved_command(std::string_view name) noexcept {
    return std::find(RESERVED_COMMANDS.begin(), RESERVED_COMMANDS.end(),
                     name) != RESERVED_COMMANDS.end();
}

// ===================================================================
// EnvelopeError
// ===================================================================

std::string_view envelope_error_kind_name(EnvelopeErrorKind kind) noexcept {
    switch (kind) {
        case EnvelopeErrorKind::TRUNCATED:            return "TRUNCATED";
        case EnvelopeErrorKind::BAD_LENGTH:           return "BAD_LENGTH";
        case EnvelopeErrorKind::BAD_CHECKSUM:         return "BAD_CHECKSUM";
        case EnvelopeErrorKind::UNRECOGNIZED_COMMAND: return "UNRECOGNIZED_COMMAND";
        case EnvelopeErrorKind::NOT_IMPLEMENTED:      return "NOT_IMPLEMENTED";
        case EnvelopeErrorKind::PAYLOAD_DECODE:       return "PAYLOAD_DECODE";
    }
    return "UNKNOWN";
}

std::string EnvelopeError::format() const {
    std::string out(envelope_error_kind_name(kind));
    if (!command.empty()) {
        out += " '";
        out += command;
        out += '\'';
    }
    if (cause) {
        out += ": ";
        out += core::error_code_name(cause.code());
        if (!cause.message().empty()) {
            out += ": ";
            out += cause.message();
        }
    }
    return out;
}

// ===================================================================
// Payload encode / decode
// ===================================================================

std::vector<uint8_t> serialize_payload(const NetworkMessage& msg) {
    return std::visit([](const auto& m) { return m.serialize(); }, msg);
}

core::Result<NetworkMessage, EnvelopeError> decode_payload(
    std::string_view command, std::span<const uint8_t> payload) {
    auto kind = kind_from_command(command);
    if (!kind.has_value()) {
        if (is_reserved_command(command)) {
            return make_envelope_error(
                EnvelopeErrorKind::NOT_IMPLEMENTED, std::string(command),
                core::Error(core::ErrorCode::NOT_IMPLEMENTED,
                            "no codec for '" + std::string(command) + "'"));
        }
        return make_envelope_error(
            EnvelopeErrorKind::UNRECOGNIZED_COMMAND, std::string(command),
            core::Error(core::ErrorCode::NETWORK_UNKNOWN,
                        "unrecognized command '" + std::string(command)
                        + "'"));
    }

    auto decoded = PAYLOAD_DECODERS[static_cast<size_t>(*kind)](payload);
    if (!decoded.ok()) {
        return make_envelope_error(EnvelopeErrorKind::PAYLOAD_DECODE,
                                   std::string(command),
                                   std::move(decoded).error());
    }
    return std::move(decoded).value();
}

// ===================================================================
// Envelope encode
// ===================================================================

std::vector<uint8_t> encode_message(const RawNetworkMessage& msg) {
    std::vector<uint8_t> payload = serialize_payload(msg.payload);

    std::vector<uint8_t> out;
    out.reserve(MESSAGE_HEADER_SIZE + payload.size());

    core::VectorWriter writer(out);
    core::ser_write_u32(writer, msg.magic);
    CommandBytes tag = CommandString::encode(msg.command());
    core::ser_write_bytes(writer, std::span<const uint8_t>(tag));

    frame_into(out, payload);
    return out;
}

// ===================================================================
// Envelope decode
// ===================================================================

core::Result<RawNetworkMessage, EnvelopeError> decode_message(
    std::span<const uint8_t> data) {
    core::SpanReader reader{data};

    // -- magic ---------------------------------------------------------
    if (reader.remaining() < 4) {
        return make_envelope_error(
            EnvelopeErrorKind::TRUNCATED, {},
            core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                        "frame too short for magic: "
                        + std::to_string(data.size()) + " bytes"));
    }
    uint32_t magic = core::ser_read_u32(reader);

    // -- command -------------------------------------------------------
    auto name = CommandString::deserialize(data.subspan(reader.tell()));
    if (!name.ok()) {
        return make_envelope_error(EnvelopeErrorKind::TRUNCATED, {},
                                   std::move(name).error());
    }
    std::string command = std::move(name).value();
    reader.seek(reader.tell() + COMMAND_SIZE);

    // -- length, checksum, payload ------------------------------------
    auto payload = unframe(reader);
    if (!payload.ok()) {
        core::Error cause = std::move(payload).error();
        EnvelopeErrorKind kind = framing_error_kind(cause.code());
        return make_envelope_error(kind, std::move(command),
                                   std::move(cause));
    }
    if (!reader.eof()) {
        return make_envelope_error(
            EnvelopeErrorKind::BAD_LENGTH, std::move(command),
            core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                        std::to_string(reader.remaining())
                        + " trailing bytes after frame"));
    }

    // -- dispatch ------------------------------------------------------
    auto msg = decode_payload(command, payload.value());
    if (!msg.ok()) {
        return std::move(msg).error();
    }

    LOG_TRACE(core::LogCategory::NET,
              "decoded '" + command + "' (" + std::to_string(
                  payload.value().size()) + " bytes) magic="
              + hex32(magic));

    return RawNetworkMessage{magic, std::move(msg).value()};
}

} // namespace net::transport
