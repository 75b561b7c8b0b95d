#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA-256 wrapper around the OpenSSL 3.0+ EVP API.
//
// sha256d (SHA-256 applied twice) is the integrity hash of the P2P frame
// and the identity hash of blocks and transactions.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

// Forward-declare the OpenSSL context type so callers do not need the
// OpenSSL headers just to include this header.
struct evp_md_ctx_st;       // EVP_MD_CTX
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

inline constexpr size_t SHA256_DIGEST_SIZE = 32;

using Sha256Digest = std::array<uint8_t, SHA256_DIGEST_SIZE>;

// ===================================================================
// One-shot hash functions
// ===================================================================

/// Single SHA-256 of a byte span.
[[nodiscard]] Sha256Digest sha256(std::span<const uint8_t> data);

/// SHA-256(SHA-256(data)), raw digest bytes.
[[nodiscard]] Sha256Digest sha256d(std::span<const uint8_t> data);

/// SHA-256(SHA-256(data)) as a uint256 (digest bytes in storage order),
/// the form used for block hashes and txids.
[[nodiscard]] core::uint256 hash256(std::span<const uint8_t> data);

// ===================================================================
// Incremental hasher (streaming interface)
// ===================================================================

/// Move-only incremental SHA-256 hasher backed by an OpenSSL
/// EVP_MD_CTX.  Feed data with write(), obtain the digest with
/// finalize().  Call reset() to reuse the object for another hash.
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    Sha256Hasher(Sha256Hasher&& other) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&& other) noexcept;

    Sha256Hasher& write(std::span<const uint8_t> data);

    /// Produce the 32-byte digest.  The context is consumed; call
    /// reset() before hashing again.
    [[nodiscard]] Sha256Digest finalize();

    /// finalize(), then SHA-256 the digest once more.
    [[nodiscard]] Sha256Digest finalize_double();

    void reset();

private:
    EVP_MD_CTX* ctx_ = nullptr;
    bool finalized_ = false;
};

}  // namespace crypto
