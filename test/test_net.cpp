// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for network parameters, command tags, framing and the
// message envelope.

#include "test_framework.h"

#include "core/hex.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "net/params.h"
#include "net/transport/checked_data.h"
#include "net/transport/command.h"
#include "net/transport/frame_reader.h"
#include "net/transport/message.h"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace net::transport;
namespace proto = net::protocol;

namespace {

constexpr uint32_t MAIN_MAGIC = 0xd9b4bef9;

const char* VERACK_FRAME =
    "f9beb4d976657261636b000000000000000000005df6e0e2";
const char* PING_100_FRAME =
    "f9beb4d970696e670000000000000000080000002467f11d6400000000000000";
const char* PONG_100_FRAME =
    "f9beb4d9706f6e670000000000000000080000002467f11d6400000000000000";

std::vector<uint8_t> unhex(const char* hex) {
    return *core::from_hex(hex);
}

// Frame with an arbitrary tag and a correct checksum.
std::vector<uint8_t> raw_frame(std::string_view command,
                               std::span<const uint8_t> payload,
                               uint32_t magic = MAIN_MAGIC) {
    std::vector<uint8_t> out;
    core::VectorWriter w(out);
    core::ser_write_u32(w, magic);
    auto tag = CommandString::encode(command);
    core::ser_write_bytes(w, std::span<const uint8_t>(tag));
    frame_into(out, payload);
    return out;
}

core::uint256 hash_n(uint8_t n) {
    std::array<uint8_t, 32> bytes{};
    bytes[0] = n;
    return core::uint256::from_bytes(std::span<const uint8_t, 32>(bytes));
}

std::vector<NetworkMessage> one_of_each() {
    proto::VersionMessage version;
    version.timestamp = 1700000000;
    version.addr_recv = proto::NetAddress::from_ipv4(1, 2, 3, 4, 8333);
    version.nonce = 42;
    version.start_height = 100;

    proto::AddrMessage addr;
    addr.addresses.push_back(
        {1700000000, proto::NetAddress::from_ipv4(9, 9, 9, 9, 8333)});

    std::vector<proto::InvItem> items = {{proto::InvType::BLOCK, hash_n(1)}};

    proto::GetBlocksMessage getblocks;
    getblocks.locator_hashes = {hash_n(2)};
    proto::GetHeadersMessage getheaders;
    getheaders.locator_hashes = {hash_n(3), hash_n(4)};
    getheaders.hash_stop = hash_n(5);

    primitives::Transaction tx(
        {primitives::TxInput(primitives::OutPoint(hash_n(6), 1), {0x51})},
        {primitives::TxOutput(1234, {0x6a})});

    primitives::Block block(primitives::BlockHeader(), {tx});
    block.header().merkle_root = block.compute_merkle_root();

    proto::HeadersMessage headers;
    headers.headers = {block.header()};

    std::vector<NetworkMessage> out;
    out.emplace_back(version);
    out.emplace_back(proto::VerackMessage{});
    out.emplace_back(addr);
    out.emplace_back(proto::InvMessage{items});
    out.emplace_back(proto::GetDataMessage{items});
    out.emplace_back(proto::NotFoundMessage{items});
    out.emplace_back(getblocks);
    out.emplace_back(getheaders);
    out.emplace_back(proto::TxMessage{tx});
    out.emplace_back(proto::BlockMessage{block});
    out.emplace_back(headers);
    out.emplace_back(proto::PingMessage{7});
    out.emplace_back(proto::PongMessage{8});
    return out;
}

} // anonymous namespace

// ===========================================================================
// Network parameters
// ===========================================================================

TEST_CASE(Params, magic_values) {
    CHECK_EQ(net::network_magic(net::Network::MAIN), 0xd9b4bef9u);
    CHECK_EQ(net::network_magic(net::Network::TESTNET), 0x0709110bu);
    CHECK_EQ(net::network_magic(net::Network::REGTEST), 0xdab5bffau);
    CHECK_EQ(net::network_magic(net::Network::SIGNET), 0x40cf030au);
    CHECK_EQ(net::NetworkParams::get(net::Network::REGTEST).default_port,
             18444);
}

TEST_CASE(Params, lookup_by_name_and_magic) {
    auto main = net::network_from_name("main");
    CHECK_OK(main);
    CHECK(main.value() == net::Network::MAIN);

    auto test = net::network_from_name("testnet");
    CHECK_OK(test);
    CHECK(test.value() == net::Network::TESTNET);

    auto bad = net::network_from_name("moonnet");
    CHECK_ERR(bad);
    CHECK_EQ(bad.error().code(), core::ErrorCode::NETWORK_UNKNOWN);

    auto found = net::network_from_magic(0x40cf030a);
    CHECK(found.has_value());
    CHECK(*found == net::Network::SIGNET);
    CHECK(!net::network_from_magic(0xdeadbeef).has_value());
}

// ===========================================================================
// Command tags
// ===========================================================================

TEST_CASE(CommandString, zero_padded) {
    auto tag = CommandString::encode("Andrew");
    CHECK_EQ(core::to_hex(tag), "416e64726577000000000000");
    CHECK_EQ(CommandString::decode(tag), "Andrew");
}

TEST_CASE(CommandString, full_width_name) {
    auto tag = CommandString::encode("abcdefghijkl");
    CHECK_EQ(tag[11], 'l');
    CHECK_EQ(CommandString::decode(tag), "abcdefghijkl");
}

TEST_CASE(CommandString, rejects_long_name) {
    CHECK_THROWS(CommandString::encode("abcdefghijklm"), std::length_error);
    CHECK(!command_fits("abcdefghijklm"));
    CHECK(command_fits("sendaddrv2"));
}

TEST_CASE(CommandString, stops_at_first_zero) {
    CommandBytes tag = {'p', 'i', 0, 'g', 0, 0, 0, 0, 0, 0, 0, 0};
    CHECK_EQ(CommandString::decode(tag), "pi");
}

TEST_CASE(CommandString, passes_high_bytes_through) {
    CommandBytes tag = {0xff, 0x80, 'a', 0, 'b', 0, 0, 0, 0, 0, 0, 0};
    std::string name = CommandString::decode(tag);
    CHECK_EQ(name.size(), 3u);
    CHECK_EQ(name, std::string("\xff\x80" "a"));
}

TEST_CASE(CommandString, all_zero_tag_is_empty) {
    CommandBytes tag{};
    CHECK(CommandString::decode(tag).empty());
}

TEST_CASE(CommandString, short_input) {
    std::vector<uint8_t> eleven(11, 'a');
    auto r = CommandString::deserialize(eleven);
    CHECK_ERR(r);
    CHECK_EQ(r.error().code(), core::ErrorCode::PARSE_UNDERFLOW);
}

TEST_CASE(CommandTable, names_and_kinds) {
    CHECK_EQ(COMMAND_TABLE.size(), MESSAGE_KIND_COUNT);
    CHECK_EQ(command_name(MessageKind::GETHEADERS), "getheaders");
    CHECK_EQ(command_name(MessageKind::PONG), "pong");

    auto kind = kind_from_command("notfound");
    CHECK(kind.has_value());
    CHECK(*kind == MessageKind::NOTFOUND);
    CHECK(!kind_from_command("getaddr").has_value());
    CHECK(!kind_from_command("PING").has_value());

    CHECK(is_reserved_command("mempool"));
    CHECK(!is_reserved_command("ping"));

    NetworkMessage msg = proto::GetDataMessage{};
    CHECK(message_kind(msg) == MessageKind::GETDATA);
    CHECK_EQ(command_name(msg), "getdata");
}

// ===========================================================================
// CheckedData framing
// ===========================================================================

TEST_CASE(CheckedData, empty_payload) {
    auto out = frame({});
    CHECK_EQ(core::to_hex(out), "000000005df6e0e2");

    core::SpanReader reader{std::span<const uint8_t>(out)};
    auto payload = unframe(reader);
    CHECK_OK(payload);
    CHECK(payload.value().empty());
    CHECK(reader.eof());
}

TEST_CASE(CheckedData, detects_corruption) {
    std::vector<uint8_t> payload = {1, 2, 3, 4};
    auto out = frame(payload);
    out.back() ^= 0x01;

    core::SpanReader reader{std::span<const uint8_t>(out)};
    auto r = unframe(reader);
    CHECK_ERR(r);
    CHECK_EQ(r.error().code(), core::ErrorCode::PARSE_BAD_CHECKSUM);
}

TEST_CASE(CheckedData, short_payload) {
    std::vector<uint8_t> payload = {1, 2, 3, 4};
    auto out = frame(payload);
    out.pop_back();

    core::SpanReader reader{std::span<const uint8_t>(out)};
    auto r = unframe(reader);
    CHECK_ERR(r);
    CHECK_EQ(r.error().code(), core::ErrorCode::PARSE_UNDERFLOW);
}

// ===========================================================================
// Envelope encoding
// ===========================================================================

TEST_CASE(Envelope, verack_vector) {
    RawNetworkMessage msg{MAIN_MAGIC, proto::VerackMessage{}};
    CHECK_EQ(core::to_hex(encode_message(msg)), VERACK_FRAME);

    auto back = decode_message(unhex(VERACK_FRAME));
    CHECK_OK(back);
    CHECK(back.value() == msg);
    CHECK(back.value().kind() == MessageKind::VERACK);
}

TEST_CASE(Envelope, ping_pong_vectors) {
    RawNetworkMessage ping{MAIN_MAGIC, proto::PingMessage{100}};
    RawNetworkMessage pong{MAIN_MAGIC, proto::PongMessage{100}};
    CHECK_EQ(core::to_hex(encode_message(ping)), PING_100_FRAME);
    CHECK_EQ(core::to_hex(encode_message(pong)), PONG_100_FRAME);

    auto back = decode_message(unhex(PONG_100_FRAME));
    CHECK_OK(back);
    CHECK(std::holds_alternative<proto::PongMessage>(back.value().payload));
    CHECK_EQ(back.value().command(), "pong");
}

TEST_CASE(Envelope, every_kind_roundtrips) {
    auto messages = one_of_each();
    CHECK_EQ(messages.size(), MESSAGE_KIND_COUNT);

    for (size_t i = 0; i < messages.size(); ++i) {
        RawNetworkMessage msg{net::network_magic(net::Network::REGTEST),
                              messages[i]};
        CHECK_EQ(static_cast<size_t>(msg.kind()), i);

        auto bytes = encode_message(msg);
        CHECK_EQ(bytes.size(), MESSAGE_HEADER_SIZE
                               + serialize_payload(messages[i]).size());

        auto back = decode_message(bytes);
        CHECK_OK(back);
        if (back.ok()) {
            CHECK(back.value() == msg);
        }
    }
}

TEST_CASE(Envelope, keeps_foreign_magic) {
    RawNetworkMessage msg{0x12345678, proto::PingMessage{1}};
    auto back = decode_message(encode_message(msg));
    CHECK_OK(back);
    CHECK_EQ(back.value().magic, 0x12345678u);
}

// ===========================================================================
// Envelope decode errors
// ===========================================================================

TEST_CASE(Envelope, every_prefix_is_truncated) {
    auto full = unhex(PING_100_FRAME);
    for (size_t n = 0; n < full.size(); ++n) {
        auto r = decode_message(std::span<const uint8_t>(full.data(), n));
        CHECK_ERR(r);
        if (r.ok()) continue;
        CHECK(r.error().kind == EnvelopeErrorKind::TRUNCATED);
        CHECK_EQ(r.error().cause.code(), core::ErrorCode::PARSE_UNDERFLOW);
        CHECK_EQ(r.error().command, n >= 16 ? std::string("ping")
                                            : std::string());
    }
}

TEST_CASE(Envelope, unrecognized_command) {
    auto bytes = raw_frame("bogus", {});
    auto r = decode_message(bytes);
    CHECK_ERR(r);
    CHECK(r.error().kind == EnvelopeErrorKind::UNRECOGNIZED_COMMAND);
    CHECK_EQ(r.error().command, "bogus");
}

TEST_CASE(Envelope, all_zero_command) {
    auto bytes = unhex(VERACK_FRAME);
    std::fill(bytes.begin() + 4, bytes.begin() + 16, uint8_t{0});
    auto r = decode_message(bytes);
    CHECK_ERR(r);
    CHECK(r.error().kind == EnvelopeErrorKind::UNRECOGNIZED_COMMAND);
    CHECK(r.error().command.empty());
}

TEST_CASE(Envelope, tx_without_inputs_is_not_encodable) {
    primitives::Transaction tx({}, {primitives::TxOutput(5, {0x51})});
    RawNetworkMessage msg{MAIN_MAGIC, proto::TxMessage{tx}};
    CHECK_THROWS(encode_message(msg), std::invalid_argument);

    // The same bytes a legacy encoder would emit do not decode.
    auto raw = raw_frame("tx", tx.serialize_no_witness());
    auto r = decode_message(raw);
    CHECK_ERR(r);
    CHECK(r.error().kind == EnvelopeErrorKind::PAYLOAD_DECODE);
    CHECK_EQ(r.error().command, "tx");
}

TEST_CASE(Envelope, reserved_command_not_implemented) {
    auto bytes = raw_frame("getaddr", {});
    auto r = decode_message(bytes);
    CHECK_ERR(r);
    CHECK(r.error().kind == EnvelopeErrorKind::NOT_IMPLEMENTED);
    CHECK_EQ(r.error().command, "getaddr");
    CHECK_EQ(r.error().cause.code(), core::ErrorCode::NOT_IMPLEMENTED);
}

TEST_CASE(Envelope, bad_checksum) {
    auto bytes = unhex(PING_100_FRAME);
    bytes[20] ^= 0xff;
    auto r = decode_message(bytes);
    CHECK_ERR(r);
    CHECK(r.error().kind == EnvelopeErrorKind::BAD_CHECKSUM);
    CHECK_EQ(r.error().command, "ping");
}

TEST_CASE(Envelope, oversize_length) {
    auto bytes = unhex(VERACK_FRAME);
    // length = MAX_PAYLOAD_SIZE + 1
    uint32_t len = static_cast<uint32_t>(MAX_PAYLOAD_SIZE + 1);
    bytes[16] = static_cast<uint8_t>(len);
    bytes[17] = static_cast<uint8_t>(len >> 8);
    bytes[18] = static_cast<uint8_t>(len >> 16);
    bytes[19] = static_cast<uint8_t>(len >> 24);

    auto r = decode_message(bytes);
    CHECK_ERR(r);
    CHECK(r.error().kind == EnvelopeErrorKind::BAD_LENGTH);
    CHECK_EQ(r.error().cause.code(), core::ErrorCode::PARSE_OVERFLOW);
}

TEST_CASE(Envelope, trailing_bytes) {
    auto bytes = unhex(VERACK_FRAME);
    bytes.push_back(0x00);
    auto r = decode_message(bytes);
    CHECK_ERR(r);
    CHECK(r.error().kind == EnvelopeErrorKind::BAD_LENGTH);
    CHECK_EQ(r.error().command, "verack");
}

TEST_CASE(Envelope, payload_error_keeps_cause) {
    std::vector<uint8_t> short_nonce = {1, 2, 3};
    auto bytes = raw_frame("ping", short_nonce);
    auto r = decode_message(bytes);
    CHECK_ERR(r);
    CHECK(r.error().kind == EnvelopeErrorKind::PAYLOAD_DECODE);
    CHECK_EQ(r.error().command, "ping");
    CHECK_EQ(r.error().cause.code(), core::ErrorCode::PARSE_UNDERFLOW);
    CHECK(r.error().format().find("PAYLOAD_DECODE 'ping'") == 0);
}

TEST_CASE(Envelope, verack_with_payload) {
    std::vector<uint8_t> junk = {0xaa};
    auto r = decode_message(raw_frame("verack", junk));
    CHECK_ERR(r);
    CHECK(r.error().kind == EnvelopeErrorKind::PAYLOAD_DECODE);
    CHECK_EQ(r.error().cause.code(), core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(Envelope, decode_payload_by_name) {
    auto r = decode_payload("ping", proto::PingMessage{9}.serialize());
    CHECK_OK(r);
    CHECK(std::get<proto::PingMessage>(r.value()).nonce == 9u);

    auto unknown = decode_payload("", {});
    CHECK_ERR(unknown);
    CHECK(unknown.error().kind == EnvelopeErrorKind::UNRECOGNIZED_COMMAND);
}

// ===========================================================================
// FrameReader
// ===========================================================================

TEST_CASE(FrameReader, byte_at_a_time) {
    auto bytes = unhex(PING_100_FRAME);
    FrameReader reader;
    for (size_t i = 0; i + 1 < bytes.size(); ++i) {
        reader.feed(std::span<const uint8_t>(&bytes[i], 1));
        CHECK(!reader.next().has_value());
    }
    reader.feed(std::span<const uint8_t>(&bytes.back(), 1));

    auto item = reader.next();
    CHECK(item.has_value());
    CHECK_OK(*item);
    CHECK(std::get<proto::PingMessage>(item->value().payload).nonce == 100u);
    CHECK_EQ(reader.buffered(), 0u);
}

TEST_CASE(FrameReader, several_frames_in_one_feed) {
    auto stream = unhex(VERACK_FRAME);
    auto ping = unhex(PING_100_FRAME);
    auto bogus = raw_frame("bogus", {});
    stream.insert(stream.end(), bogus.begin(), bogus.end());
    stream.insert(stream.end(), ping.begin(), ping.end());
    stream.push_back(0xf9);  // start of a fourth frame

    FrameReader reader;
    reader.feed(stream);

    auto first = reader.next();
    CHECK(first.has_value() && first->ok());

    // A bad frame is reported without stopping the stream.
    auto second = reader.next();
    CHECK(second.has_value() && !second->ok());
    CHECK(second->error().kind == EnvelopeErrorKind::UNRECOGNIZED_COMMAND);
    CHECK(!reader.failed());

    auto third = reader.next();
    CHECK(third.has_value() && third->ok());
    CHECK(!reader.next().has_value());
    CHECK_EQ(reader.buffered(), 1u);
}

TEST_CASE(FrameReader, oversize_length_fails_stream) {
    auto bytes = unhex(VERACK_FRAME);
    bytes[19] = 0xff;

    FrameReader reader;
    reader.feed(bytes);
    auto item = reader.next();
    CHECK(item.has_value());
    CHECK(!item->ok());
    CHECK(item->error().kind == EnvelopeErrorKind::BAD_LENGTH);
    CHECK_EQ(item->error().command, "verack");
    CHECK(reader.failed());

    reader.feed(unhex(VERACK_FRAME));
    CHECK(!reader.next().has_value());
    CHECK_EQ(reader.buffered(), 0u);

    reader.reset();
    reader.feed(unhex(VERACK_FRAME));
    auto after = reader.next();
    CHECK(after.has_value() && after->ok());
}
