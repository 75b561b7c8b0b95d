// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the crypto module (SHA-256 via OpenSSL).

#include "test_framework.h"

#include "core/hex.h"
#include "crypto/sha256.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(std::string_view s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // anonymous namespace

TEST_CASE(Sha256, EmptyInput) {
    CHECK_EQ(core::to_hex(crypto::sha256({})),
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE(Sha256, AbcInput) {
    CHECK_EQ(core::to_hex(crypto::sha256(bytes_of("abc"))),
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE(Sha256, TwoBlockInput) {
    auto data = bytes_of(
        "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");
    CHECK_EQ(core::to_hex(crypto::sha256(data)),
             "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE(Sha256, DoubleHashOfEmpty) {
    // The first four bytes are the checksum of an empty frame payload.
    CHECK_EQ(core::to_hex(crypto::sha256d({})),
             "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

TEST_CASE(Sha256, Hash256DisplaysReversed) {
    auto h = crypto::hash256({});
    CHECK_EQ(h.to_hex(),
             "56944c5d3f98413ef45cf54545538103cc9f298e0575820ad3591376e2e0f65d");
}

TEST_CASE(Sha256, IncrementalMatchesOneShot) {
    auto data = bytes_of(
        "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");

    crypto::Sha256Hasher hasher;
    hasher.write(std::span<const uint8_t>(data).first(10))
          .write(std::span<const uint8_t>(data).subspan(10));
    CHECK(hasher.finalize() == crypto::sha256(data));

    hasher.reset();
    hasher.write(data);
    CHECK(hasher.finalize_double() == crypto::sha256d(data));
}

TEST_CASE(Sha256, HasherRejectsUseAfterFinalize) {
    crypto::Sha256Hasher hasher;
    (void)hasher.finalize();
    CHECK_THROWS(hasher.write(bytes_of("x")), std::runtime_error);
    CHECK_THROWS(hasher.finalize(), std::runtime_error);

    hasher.reset();
    CHECK_EQ(core::to_hex(hasher.finalize()),
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE(Sha256, MovedHasherKeepsState) {
    crypto::Sha256Hasher a;
    a.write(bytes_of("abc"));
    crypto::Sha256Hasher b(std::move(a));
    CHECK_EQ(core::to_hex(b.finalize()),
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
