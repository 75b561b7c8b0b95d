#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// P2P message envelope.
//
// Wire format (little-endian):
//   Offset  Size  Field
//   0       4     magic        (network identifier, see net/params.h)
//   4       12    command      (zero-padded name, see command.h)
//   16      4     length       (bytes of payload)
//   20      4     checksum     (first 4 bytes of SHA-256d of payload)
//   24      N     payload      (domain encoding of the message, N == length)
//
// The last three fields are the CheckedData framing of checked_data.h.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "net/protocol/addr.h"
#include "net/protocol/blocks.h"
#include "net/protocol/headers.h"
#include "net/protocol/inventory.h"
#include "net/protocol/ping.h"
#include "net/protocol/transactions.h"
#include "net/protocol/version.h"
#include "net/transport/command.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace net::transport {

/// magic + command + length + checksum.
inline constexpr size_t MESSAGE_HEADER_SIZE = 24;

// ===================================================================
// Message kinds and the command name table
// ===================================================================

/// Declaration order matches the alternatives of NetworkMessage, so a
/// kind's value is the variant index of its payload type.
enum class MessageKind : uint8_t {
    VERSION,
    VERACK,
    ADDR,
    INV,
    GETDATA,
    NOTFOUND,
    GETBLOCKS,
    GETHEADERS,
    TX,
    BLOCK,
    HEADERS,
    PING,
    PONG,
};

using NetworkMessage = std::variant<
    protocol::VersionMessage,
    protocol::VerackMessage,
    protocol::AddrMessage,
    protocol::InvMessage,
    protocol::GetDataMessage,
    protocol::NotFoundMessage,
    protocol::GetBlocksMessage,
    protocol::GetHeadersMessage,
    protocol::TxMessage,
    protocol::BlockMessage,
    protocol::HeadersMessage,
    protocol::PingMessage,
    protocol::PongMessage>;

inline constexpr size_t MESSAGE_KIND_COUNT = std::variant_size_v<NetworkMessage>;

struct CommandEntry {
    MessageKind      kind;
    std::string_view name;
};

inline constexpr std::array<CommandEntry, MESSAGE_KIND_COUNT> COMMAND_TABLE = {{
    {MessageKind::VERSION,    "version"},
    {MessageKind::VERACK,     "verack"},
    {MessageKind::ADDR,       "addr"},
    {MessageKind::INV,        "inv"},
    {MessageKind::GETDATA,    "getdata"},
    {MessageKind::NOTFOUND,   "notfound"},
    {MessageKind::GETBLOCKS,  "getblocks"},
    {MessageKind::GETHEADERS, "getheaders"},
    {MessageKind::TX,         "tx"},
    {MessageKind::BLOCK,      "block"},
    {MessageKind::HEADERS,    "headers"},
    {MessageKind::PING,       "ping"},
    {MessageKind::PONG,       "pong"},
}};

namespace detail {

constexpr bool command_table_is_well_formed() {
    for (size_t i = 0; i < COMMAND_TABLE.size(); ++i) {
        const auto& entry = COMMAND_TABLE[i];
        if (static_cast<size_t>(entry.kind) != i) return false;
        if (entry.name.empty() || !command_fits(entry.name)) return false;
        if (entry.name.find('\0') != std::string_view::npos) return false;
        for (size_t j = 0; j < i; ++j) {
            if (COMMAND_TABLE[j].name == entry.name) return false;
        }
    }
    return true;
}

} // namespace detail

static_assert(detail::command_table_is_well_formed(),
              "command table must be indexed by kind, with unique names "
              "of 1..12 bytes");

/// Commands that belong to the protocol but have no payload codec here.
inline constexpr std::array<std::string_view, 11> RESERVED_COMMANDS = {
    "getaddr", "mempool", "checkorder", "submitorder", "reply", "reject",
    "filterload", "filteradd", "filterclear", "merkleblock", "alert",
};

[[nodiscard]] constexpr std::string_view command_name(
    MessageKind kind) noexcept {
    return COMMAND_TABLE[static_cast<size_t>(kind)].name;
}

[[nodiscard]] std::optional<MessageKind> kind_from_command(
    std::string_view name) noexcept;

[[nodiscard]] bool is_reserved_command(std::string_view name) noexcept;

[[nodiscard]] inline MessageKind message_kind(
    const NetworkMessage& msg) noexcept {
    return static_cast<MessageKind>(msg.index());
}

[[nodiscard]] inline std::string_view command_name(
    const NetworkMessage& msg) noexcept {
    return command_name(message_kind(msg));
}

// ===================================================================
// RawNetworkMessage -- magic plus typed payload
// ===================================================================

struct RawNetworkMessage {
    uint32_t       magic = 0;
    NetworkMessage payload;

    [[nodiscard]] MessageKind kind() const noexcept {
        return message_kind(payload);
    }
    [[nodiscard]] std::string_view command() const noexcept {
        return command_name(payload);
    }

    bool operator==(const RawNetworkMessage&) const = default;
};

// ===================================================================
// EnvelopeError
// ===================================================================

enum class EnvelopeErrorKind : uint8_t {
    TRUNCATED,             // input ended inside the frame
    BAD_LENGTH,            // declared length too large, or trailing data
    BAD_CHECKSUM,
    UNRECOGNIZED_COMMAND,
    NOT_IMPLEMENTED,       // reserved command without a codec
    PAYLOAD_DECODE,        // known command, payload rejected
};

[[nodiscard]] std::string_view envelope_error_kind_name(
    EnvelopeErrorKind kind) noexcept;

struct EnvelopeError {
    EnvelopeErrorKind kind = EnvelopeErrorKind::TRUNCATED;

    /// Decoded command name; empty when the failure precedes the tag.
    std::string command;

    /// Underlying codec error.
    core::Error cause;

    /// "PAYLOAD_DECODE 'ping': PARSE_UNDERFLOW(102): ..."
    [[nodiscard]] std::string format() const;

    bool operator==(const EnvelopeError& o) const noexcept {
        return kind == o.kind && command == o.command;
    }
};

// ===================================================================
// Encode / decode
// ===================================================================

/// Domain encoding of @p msg (empty for verack).
[[nodiscard]] std::vector<uint8_t> serialize_payload(const NetworkMessage& msg);

/// Decode @p payload as the message named @p command.
[[nodiscard]] core::Result<NetworkMessage, EnvelopeError> decode_payload(
    std::string_view command, std::span<const uint8_t> payload);

/// Complete wire frame for @p msg.
[[nodiscard]] std::vector<uint8_t> encode_message(const RawNetworkMessage& msg);

/// Decode exactly one frame.  Bytes after the frame are rejected as
/// BAD_LENGTH.
[[nodiscard]] core::Result<RawNetworkMessage, EnvelopeError> decode_message(
    std::span<const uint8_t> data);

} // namespace net::transport
