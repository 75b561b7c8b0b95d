// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:               return "NONE";

        // Parsing
        case ErrorCode::PARSE_ERROR:        return "PARSE_ERROR";
        case ErrorCode::PARSE_OVERFLOW:     return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_UNDERFLOW:    return "PARSE_UNDERFLOW";
        case ErrorCode::PARSE_BAD_FORMAT:   return "PARSE_BAD_FORMAT";
        case ErrorCode::PARSE_BAD_CHECKSUM: return "PARSE_BAD_CHECKSUM";

        // Validation
        case ErrorCode::VALIDATION_ERROR:   return "VALIDATION_ERROR";
        case ErrorCode::VALIDATION_RANGE:   return "VALIDATION_RANGE";

        // Network
        case ErrorCode::NETWORK_ERROR:      return "NETWORK_ERROR";
        case ErrorCode::NETWORK_UNKNOWN:    return "NETWORK_UNKNOWN";

        // Cryptography
        case ErrorCode::CRYPTO_ERROR:       return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_HASH_FAIL:   return "CRYPTO_HASH_FAIL";

        // Configuration
        case ErrorCode::CONFIG_ERROR:       return "CONFIG_ERROR";
        case ErrorCode::CONFIG_BAD_VALUE:   return "CONFIG_BAD_VALUE";

        // Internal
        case ErrorCode::INTERNAL_ERROR:     return "INTERNAL_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:    return "NOT_IMPLEMENTED";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    // Append source location when available (file name is non-empty).
    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

} // namespace core
