// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/block_header.h"

#include "core/stream.h"
#include "crypto/sha256.h"

#include <algorithm>
#include <vector>

namespace primitives {

core::uint256 BlockHeader::hash() const {
    auto bytes = serialize_array();
    return crypto::hash256(bytes);
}

std::array<uint8_t, BlockHeader::SERIALIZED_SIZE>
BlockHeader::serialize_array() const {
    std::vector<uint8_t> buf;
    buf.reserve(SERIALIZED_SIZE);
    core::VectorWriter w(buf);
    serialize(w);

    std::array<uint8_t, SERIALIZED_SIZE> out{};
    std::copy(buf.begin(), buf.end(), out.begin());
    return out;
}

} // namespace primitives
