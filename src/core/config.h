#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Common configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONF           = "conf";
inline constexpr const char* CONF_NETWORK        = "network";
inline constexpr const char* CONF_TESTNET        = "testnet";
inline constexpr const char* CONF_REGTEST        = "regtest";
inline constexpr const char* CONF_SIGNET         = "signet";
inline constexpr const char* CONF_LOGLEVEL       = "loglevel";
inline constexpr const char* CONF_DEBUG          = "debug";
inline constexpr const char* CONF_LOGFILE        = "logfile";
inline constexpr const char* CONF_PRINTTOCONSOLE = "printtoconsole";

// ---------------------------------------------------------------------------
// Config  --  layered key/value configuration
//
// Priority order: command-line args  >  config file  >  programmatic defaults
// Multi-value keys (e.g. -debug=net -debug=p2p) are accumulated into a
// vector accessible via get_list().  Arguments that do not start with '-'
// are kept, in order, as positionals (sub-command and its operands).
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    ///   word                       (positional)
    /// A lone "--" ends option parsing; everything after it is positional.
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style configuration file.
    /// Format per line:  key=value
    /// Lines starting with '#' and blank lines are ignored.
    /// Leading/trailing whitespace around key and value is trimmed.
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    // -- setters / getters --------------------------------------------------

    /// Set a key to a single value (replaces any previous values).
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Return the value for @p key parsed as int64, or @p default_val.
    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Return the value for @p key parsed as bool, or @p default_val.
    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Return all values associated with @p key (CLI first, then file).
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] const std::vector<std::string>& positional() const noexcept {
        return positional_;
    }

    // -- convenience accessors ----------------------------------------------

    /// Active network name.  "network" wins; otherwise the -regtest,
    /// -testnet and -signet shorthands are consulted, defaulting to "main".
    [[nodiscard]] std::string network() const;

private:
    // Two separate maps so that CLI args always override file values.
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap                 cli_values_;
    ValueMap                 file_values_;
    std::vector<std::string> positional_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
