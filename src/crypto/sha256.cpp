// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha256.h"

#include "core/logging.h"

#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

void digest_init(EVP_MD_CTX* ctx, const char* who) {
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(
            std::string(who) + ": EVP_DigestInit_ex() failed");
    }
}

/// Allocate a context already initialised for SHA-256.
EVP_MD_CTX* new_context(const char* who) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error(
            std::string(who) + ": EVP_MD_CTX_new() allocation failed");
    }
    try {
        digest_init(ctx, who);
    } catch (const std::runtime_error&) {
        EVP_MD_CTX_free(ctx);
        throw;
    }
    return ctx;
}

/// Perform a single SHA-256 digest into @p out.
void raw_sha256(const uint8_t* data, size_t len, uint8_t* out) {
    unsigned int digest_len = 0;
    if (EVP_Digest(data, len, out, &digest_len, EVP_sha256(),
                   nullptr) != 1 ||
        digest_len != SHA256_DIGEST_SIZE) {
        LOG_ERROR(core::LogCategory::CRYPTO,
                  "EVP_Digest() failed on " + std::to_string(len)
                  + " byte input");
        throw std::runtime_error("sha256: EVP_Digest() failed");
    }
}

}  // namespace

// ===================================================================
// One-shot functions
// ===================================================================

Sha256Digest sha256(std::span<const uint8_t> data) {
    Sha256Digest out{};
    raw_sha256(data.data(), data.size(), out.data());
    return out;
}

Sha256Digest sha256d(std::span<const uint8_t> data) {
    Sha256Digest first{};
    raw_sha256(data.data(), data.size(), first.data());
    Sha256Digest second{};
    raw_sha256(first.data(), first.size(), second.data());
    return second;
}

core::uint256 hash256(std::span<const uint8_t> data) {
    Sha256Digest digest = sha256d(data);
    return core::uint256::from_bytes(
        std::span<const uint8_t, 32>(digest));
}

// ===================================================================
// Sha256Hasher -- incremental interface
// ===================================================================

Sha256Hasher::Sha256Hasher()
    : ctx_(new_context("Sha256Hasher")) {}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&& other) noexcept
    : ctx_(other.ctx_), finalized_(other.finalized_) {
    other.ctx_ = nullptr;
    other.finalized_ = true;
}

Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        ctx_ = other.ctx_;
        finalized_ = other.finalized_;
        other.ctx_ = nullptr;
        other.finalized_ = true;
    }
    return *this;
}

Sha256Hasher& Sha256Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha256Hasher::write(): context not initialised "
            "or already finalised");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error(
            "Sha256Hasher::write(): EVP_DigestUpdate() failed");
    }
    return *this;
}

Sha256Digest Sha256Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha256Hasher::finalize(): context not initialised "
            "or already finalised");
    }

    Sha256Digest out{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &digest_len) != 1 ||
        digest_len != SHA256_DIGEST_SIZE) {
        throw std::runtime_error(
            "Sha256Hasher::finalize(): EVP_DigestFinal_ex() failed");
    }
    finalized_ = true;
    return out;
}

Sha256Digest Sha256Hasher::finalize_double() {
    Sha256Digest first = finalize();
    return sha256(first);
}

void Sha256Hasher::reset() {
    if (ctx_) {
        // Reuse the existing context rather than free + alloc.
        digest_init(ctx_, "Sha256Hasher::reset()");
    } else {
        ctx_ = new_context("Sha256Hasher::reset()");
    }
    finalized_ = false;
}

}  // namespace crypto
