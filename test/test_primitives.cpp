// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for transactions, headers and blocks.

#include "test_framework.h"

#include "core/hex.h"
#include "core/stream.h"
#include "crypto/sha256.h"
#include "primitives/block.h"
#include "primitives/block_header.h"
#include "primitives/outpoint.h"
#include "primitives/transaction.h"
#include "primitives/txin.h"
#include "primitives/txout.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Coinbase transaction of the Bitcoin genesis block.
const char* GENESIS_COINBASE_HEX =
    "01000000010000000000000000000000000000000000000000000000000000000000000000"
    "ffffffff4d04ffff001d0104455468652054696d65732030332f4a616e2f32303039204368"
    "616e63656c6c6f72206f6e206272696e6b206f66207365636f6e64206261696c6f757420"
    "666f722062616e6b73ffffffff0100f2052a01000000434104678afdb0fe554827196"
    "7f1a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc3f4cef38c4f35504e51e"
    "c112de5c384df7ba0b8d578a4c702b6bf11d5fac00000000";

const char* GENESIS_MERKLE_ROOT =
    "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

const char* GENESIS_HASH =
    "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f";

primitives::BlockHeader genesis_header() {
    primitives::BlockHeader h;
    h.version     = 1;
    h.merkle_root = core::uint256::from_hex(GENESIS_MERKLE_ROOT);
    h.timestamp   = 1231006505;
    h.bits        = 0x1d00ffff;
    h.nonce       = 2083236893;
    return h;
}

primitives::Transaction make_segwit_tx() {
    primitives::TxInput in(
        primitives::OutPoint(core::uint256::from_hex("ab"), 1), {});
    in.witness = {{0x30, 0x44, 0x02}, {0x02, 0x79}};
    primitives::TxOutput out(50000, {0x00, 0x14, 0xaa});
    return primitives::Transaction({in}, {out}, 2, 0);
}

} // anonymous namespace

// ===========================================================================
// OutPoint / TxInput / TxOutput
// ===========================================================================

TEST_CASE(OutPoint, default_is_null) {
    primitives::OutPoint op;
    CHECK(op.is_null());
    primitives::OutPoint other(core::uint256::from_hex("01"), 0);
    CHECK(!other.is_null());
    CHECK(op != other);
}

TEST_CASE(OutPoint, serialized_layout) {
    primitives::OutPoint op(core::uint256::from_hex("01"), 2);
    core::DataStream ds;
    op.serialize(ds);
    CHECK_EQ(ds.size(), primitives::OutPoint::SERIALIZED_SIZE);
    CHECK_EQ(ds.data()[0], 0x01);
    CHECK_EQ(ds.data()[32], 0x02);
    CHECK(primitives::OutPoint::deserialize(ds) == op);
}

TEST_CASE(TxInput, base_encoding_excludes_witness) {
    primitives::TxInput in(primitives::OutPoint(), {0xaa, 0xbb}, 7);
    in.witness = {{0x01}};
    core::DataStream ds;
    in.serialize(ds);
    CHECK_EQ(ds.size(), 36u + 1u + 2u + 4u);

    auto back = primitives::TxInput::deserialize(ds);
    CHECK_EQ(back.sequence, 7u);
    CHECK(back.witness.empty());
}

TEST_CASE(TxOutput, null_sentinel) {
    primitives::TxOutput unset;
    CHECK(unset.is_null());
    primitives::TxOutput out(0, {});
    CHECK(!out.is_null());
}

// ===========================================================================
// Transaction
// ===========================================================================

TEST_CASE(Transaction, genesis_coinbase_txid) {
    auto raw = core::from_hex(GENESIS_COINBASE_HEX);
    CHECK(raw.has_value());

    auto tx = primitives::Transaction::deserialize(*raw);
    CHECK_OK(tx);
    CHECK(tx.value().is_coinbase());
    CHECK(!tx.value().has_witness());
    CHECK_EQ(tx.value().vout().size(), 1u);
    CHECK_EQ(tx.value().vout()[0].value, 5000000000);
    CHECK_EQ(tx.value().txid().to_hex(), GENESIS_MERKLE_ROOT);
    CHECK(tx.value().wtxid() == tx.value().txid());
    CHECK(tx.value().serialize() == *raw);
}

TEST_CASE(Transaction, segwit_encoding_uses_marker) {
    auto tx = make_segwit_tx();
    CHECK(tx.has_witness());

    auto full = tx.serialize();
    CHECK_EQ(full[4], 0x00);
    CHECK_EQ(full[5], 0x01);

    auto stripped = tx.serialize_no_witness();
    CHECK(stripped.size() < full.size());
    CHECK(tx.txid() == crypto::hash256(stripped));
    CHECK(tx.wtxid() == crypto::hash256(full));
    CHECK(tx.txid() != tx.wtxid());

    auto back = primitives::Transaction::deserialize(full);
    CHECK_OK(back);
    CHECK(back.value() == tx);
    CHECK_EQ(back.value().vin()[0].witness.size(), 2u);
}

TEST_CASE(Transaction, mutation_invalidates_cached_txid) {
    auto tx = make_segwit_tx();
    core::uint256 before = tx.txid();
    tx.set_locktime(500000);
    CHECK(tx.txid() != before);
    tx.vout()[0].value = 1;
    CHECK(tx.txid() == crypto::hash256(tx.serialize_no_witness()));
}

TEST_CASE(Transaction, no_inputs_hashes_but_does_not_serialize) {
    primitives::Transaction tx({}, {primitives::TxOutput(5, {0x51})});
    CHECK_THROWS(tx.serialize(), std::invalid_argument);
    CHECK(tx.txid() == crypto::hash256(tx.serialize_no_witness()));
    CHECK(tx.wtxid() == tx.txid());

    primitives::Block block(primitives::BlockHeader(), {tx});
    CHECK_THROWS(block.serialize(), std::invalid_argument);
}

TEST_CASE(Transaction, rejects_trailing_bytes) {
    auto raw = *core::from_hex(GENESIS_COINBASE_HEX);
    raw.push_back(0x00);
    auto tx = primitives::Transaction::deserialize(raw);
    CHECK_ERR(tx);
    CHECK_EQ(tx.error().code(), core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(Transaction, rejects_truncated_input) {
    auto raw = *core::from_hex(GENESIS_COINBASE_HEX);
    raw.resize(raw.size() - 1);
    auto tx = primitives::Transaction::deserialize(raw);
    CHECK_ERR(tx);
    CHECK_EQ(tx.error().code(), core::ErrorCode::PARSE_ERROR);
}

TEST_CASE(Transaction, rejects_unknown_segwit_flag) {
    auto raw = make_segwit_tx().serialize();
    raw[5] = 0x02;
    CHECK_ERR(primitives::Transaction::deserialize(raw));
}

TEST_CASE(Transaction, rejects_superfluous_witness) {
    // Witness flag set but every stack empty.
    auto tx = make_segwit_tx();
    auto raw = tx.serialize_no_witness();
    std::vector<uint8_t> bad(raw.begin(), raw.begin() + 4);
    bad.push_back(0x00);
    bad.push_back(0x01);
    bad.insert(bad.end(), raw.begin() + 4, raw.end() - 4);
    bad.push_back(0x00);  // one input, zero witness items
    bad.insert(bad.end(), raw.end() - 4, raw.end());
    CHECK_ERR(primitives::Transaction::deserialize(bad));
}

// ===========================================================================
// BlockHeader / Block
// ===========================================================================

TEST_CASE(BlockHeader, genesis_hash) {
    auto h = genesis_header();
    CHECK_EQ(h.serialize_array().size(), 80u);
    CHECK_EQ(h.hash().to_hex(), GENESIS_HASH);
}

TEST_CASE(BlockHeader, stream_roundtrip) {
    auto h = genesis_header();
    core::DataStream ds;
    h.serialize(ds);
    CHECK_EQ(ds.size(), primitives::BlockHeader::SERIALIZED_SIZE);
    CHECK(primitives::BlockHeader::deserialize(ds) == h);
}

TEST_CASE(Block, genesis_block_decodes) {
    auto coinbase = primitives::Transaction::deserialize(
        *core::from_hex(GENESIS_COINBASE_HEX));
    CHECK_OK(coinbase);

    primitives::Block block(genesis_header(), {coinbase.value()});
    CHECK(block.is_valid_merkle_root());
    CHECK_EQ(block.hash().to_hex(), GENESIS_HASH);

    auto raw = block.serialize();
    CHECK_EQ(raw.size(), 80u + 1u + 204u);

    auto back = primitives::Block::deserialize(raw);
    CHECK_OK(back);
    CHECK(back.value() == block);
    CHECK_EQ(back.value().tx_count(), 1u);
}

TEST_CASE(Block, merkle_root_odd_level_duplicates_last) {
    auto a = make_segwit_tx();
    auto b = make_segwit_tx();
    b.set_locktime(1);
    auto c = make_segwit_tx();
    c.set_locktime(2);

    primitives::Block block(primitives::BlockHeader(), {a, b, c});

    auto pair_hash = [](const core::uint256& l, const core::uint256& r) {
        std::vector<uint8_t> buf(l.data(), l.data() + 32);
        buf.insert(buf.end(), r.data(), r.data() + 32);
        return crypto::hash256(buf);
    };
    auto ab = pair_hash(a.txid(), b.txid());
    auto cc = pair_hash(c.txid(), c.txid());
    CHECK(block.compute_merkle_root() == pair_hash(ab, cc));
    CHECK(!block.is_valid_merkle_root());
}

TEST_CASE(Block, empty_block_has_zero_merkle_root) {
    primitives::Block block;
    CHECK(block.compute_merkle_root().is_zero());
}

TEST_CASE(Block, rejects_trailing_bytes) {
    primitives::Block block(genesis_header(), {});
    auto raw = block.serialize();
    raw.push_back(0xff);
    auto back = primitives::Block::deserialize(raw);
    CHECK_ERR(back);
    CHECK_EQ(back.error().code(), core::ErrorCode::PARSE_BAD_FORMAT);
}
