// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/txout.h"

namespace primitives {

TxOutput::TxOutput(int64_t value_in, std::vector<uint8_t> script_in)
    : value(value_in)
    , script_pubkey(std::move(script_in)) {}

} // namespace primitives
