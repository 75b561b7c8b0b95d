#pragma once
// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SATWIRE_CORE_LOGGING_H
#define SATWIRE_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE       = 0,
    NET        = 1u << 0,   // envelope encode/decode, framing
    P2P        = 1u << 1,   // payload codecs
    CRYPTO     = 1u << 2,
    CONFIG     = 1u << 3,
    TOOL       = 1u << 4,   // command-line front ends
    ALL        = 0xFFFFFFFF,
};

// Bitwise operators for LogCategory so it can be used as a bitmask.
inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator~(LogCategory a) noexcept {
    return static_cast<LogCategory>(~static_cast<uint32_t>(a));
}

inline constexpr LogCategory& operator|=(LogCategory& a,
                                          LogCategory b) noexcept {
    a = a | b;
    return a;
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Returns the short string name for a single log category bit.
/// If multiple bits are set, returns the name of the lowest set bit.
/// Returns "NONE" when the value is zero.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parse a level name ("trace", "debug", "info", "warn", "error", "fatal",
/// "off"), case-insensitive.  Returns std::nullopt for anything else.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Parse a comma-separated list of category names into a bitmask.
/// Recognised names (case-insensitive): net, p2p, crypto, config, tool,
/// all, none.  Unknown names are ignored.
[[nodiscard]] LogCategory parse_log_categories(std::string_view list);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Returns the process-wide singleton instance.
    static Logger& instance();

    // -- configuration (all thread-safe) ------------------------------------

    /// Sets the minimum severity level. Messages below this are discarded.
    void set_level(LogLevel level);

    /// Enables logging for the given category (bitwise OR).
    void enable_category(LogCategory cat);

    /// Disables logging for the given category.
    void disable_category(LogCategory cat);

    /// Replaces the enabled category bitmask.
    void set_categories(LogCategory cats);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Fast lockless check: returns true if a message at the given
    /// level and category would actually be written.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    /// Enables or disables writing to stderr.
    void set_print_to_console(bool enable);

    /// Enables or disables writing to the log file.
    void set_print_to_file(bool enable);

    /// Opens (or replaces) the output log file in append mode.  An empty
    /// path closes the current file.  Returns false if the file could not
    /// be opened; file logging is then disabled.
    bool set_log_file(const std::filesystem::path& path);

    /// Flushes all buffered output to console and file sinks.
    void flush();

    // -- logging entry point ------------------------------------------------

    /// Writes a fully formatted log line. The caller is responsible for
    /// performing the will_log() check beforehand to avoid unnecessary
    /// formatting work.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);

    // -- atomic state for lockless will_log() checks -----------------------
    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    // -- guarded state for I/O ---------------------------------------------
    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::filesystem::path log_file_path_;
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// Each macro performs a lockless will_log() check before doing any string
// formatting, so disabled paths have near-zero overhead.
//
// Usage:
//   LOG_DEBUG(core::LogCategory::NET, "unrecognized command '" + cmd + "'");
// ---------------------------------------------------------------------------

#define SATWIRE_LOG_AT(lvl, cat, msg)                                     \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) SATWIRE_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) SATWIRE_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  SATWIRE_LOG_AT(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  SATWIRE_LOG_AT(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) SATWIRE_LOG_AT(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) SATWIRE_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // SATWIRE_CORE_LOGGING_H
