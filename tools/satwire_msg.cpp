// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// satwire-msg -- inspect and build P2P message frames
//
// Usage:
//   satwire-msg [options] <command> [args...]
//
// Commands:
//   decode <hex>        Decode one frame and print its contents
//   ping <nonce>        Print a ping frame
//   pong <nonce>        Print a pong frame
//   verack              Print a verack frame
//   split               Read hex from stdin and print every frame in it
//
// Options:
//   -network=NAME       main, test, regtest or signet (default: main)
//   -testnet / -regtest / -signet
//   -conf=FILE          Read key=value options from FILE
//   -loglevel=LEVEL     trace, debug, info, warn, error, off (default: warn)
//   -debug=CAT          Enable a log category (net, p2p, crypto, config, tool)
//   -logfile=FILE       Also write the log to FILE
//   -printtoconsole=0   Do not log to stderr
//
// Exit status: 0 on success, 1 on decode failure, 2 on usage error.
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/hex.h"
#include "core/logging.h"
#include "net/params.h"
#include "net/transport/frame_reader.h"
#include "net/transport/message.h"

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace {

constexpr int EXIT_OK     = 0;
constexpr int EXIT_DECODE = 1;
constexpr int EXIT_USAGE  = 2;

void print_usage() {
    std::cout << "Usage: satwire-msg [options] <command> [args...]\n\n"
              << "Commands:\n"
              << "  decode <hex>        Decode one frame and print its contents\n"
              << "  ping <nonce>        Print a ping frame\n"
              << "  pong <nonce>        Print a pong frame\n"
              << "  verack              Print a verack frame\n"
              << "  split               Read hex from stdin, print every frame\n\n"
              << "Options:\n"
              << "  -network=NAME       main, test, regtest or signet\n"
              << "  -testnet, -regtest, -signet\n"
              << "  -conf=FILE          Read options from FILE\n"
              << "  -loglevel=LEVEL     Minimum log level (default: warn)\n"
              << "  -debug=CAT          Enable a log category\n"
              << "  -logfile=FILE       Also write the log to FILE\n"
              << "  -printtoconsole=0   Do not log to stderr\n";
}

std::string hex32(uint32_t val) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%08x", val);
    return std::string(buf);
}

// ---------------------------------------------------------------------------
// Logging setup from config
// ---------------------------------------------------------------------------
bool init_logging(const core::Config& config) {
    auto& logger = core::Logger::instance();

    std::string level_name = config.get_or(core::CONF_LOGLEVEL, "warn");
    auto level = core::parse_log_level(level_name);
    if (!level.has_value()) {
        std::cerr << "Error: unknown log level '" << level_name << "'\n";
        return false;
    }
    logger.set_level(*level);

    auto cats = config.get_list(core::CONF_DEBUG);
    if (!cats.empty()) {
        core::LogCategory mask = core::LogCategory::NONE;
        for (const auto& c : cats) {
            mask |= core::parse_log_categories(c);
        }
        logger.set_categories(mask);
    }

    logger.set_print_to_console(
        config.get_bool(core::CONF_PRINTTOCONSOLE, true));

    if (auto path = config.get(core::CONF_LOGFILE);
        path.has_value() && !path->empty()) {
        if (!logger.set_log_file(*path)) {
            return false;
        }
        logger.set_print_to_file(true);
    }
    return true;
}

// ---------------------------------------------------------------------------
// Payload summaries
// ---------------------------------------------------------------------------
template <typename T>
void describe(std::ostream& os, const T& msg) {
    namespace p = net::protocol;

    if constexpr (std::is_same_v<T, p::VersionMessage>) {
        os << "  version:      " << msg.version << "\n"
           << "  services:     " << p::service_flags_to_string(msg.services)
           << "\n"
           << "  timestamp:    " << msg.timestamp << "\n"
           << "  addr_recv:    " << msg.addr_recv.to_string() << "\n"
           << "  addr_from:    " << msg.addr_from.to_string() << "\n"
           << "  nonce:        " << msg.nonce << "\n"
           << "  user_agent:   " << msg.user_agent << "\n"
           << "  start_height: " << msg.start_height << "\n"
           << "  relay:        "
           << (msg.relay.has_value() ? (*msg.relay ? "true" : "false")
                                     : "(absent)")
           << "\n";
    } else if constexpr (std::is_same_v<T, p::VerackMessage>) {
        // Empty payload.
    } else if constexpr (std::is_same_v<T, p::AddrMessage>) {
        os << "  entries: " << msg.addresses.size() << "\n";
        for (const auto& e : msg.addresses) {
            os << "    " << e.timestamp << " " << e.address.to_string()
               << "\n";
        }
    } else if constexpr (std::is_same_v<T, p::InvMessage> ||
                         std::is_same_v<T, p::GetDataMessage> ||
                         std::is_same_v<T, p::NotFoundMessage>) {
        os << "  items: " << msg.items.size() << "\n";
        for (const auto& item : msg.items) {
            os << "    " << item.to_string() << "\n";
        }
    } else if constexpr (std::is_same_v<T, p::GetBlocksMessage> ||
                         std::is_same_v<T, p::GetHeadersMessage>) {
        os << "  version:   " << msg.version << "\n"
           << "  locator:   " << msg.locator_hashes.size() << " hashes\n";
        for (const auto& h : msg.locator_hashes) {
            os << "    " << h.to_hex() << "\n";
        }
        os << "  hash_stop: " << msg.hash_stop.to_hex() << "\n";
    } else if constexpr (std::is_same_v<T, p::TxMessage>) {
        os << "  txid:    " << msg.txid().to_hex() << "\n"
           << "  inputs:  " << msg.tx.vin().size() << "\n"
           << "  outputs: " << msg.tx.vout().size() << "\n"
           << "  witness: " << (msg.tx.has_witness() ? "yes" : "no") << "\n";
    } else if constexpr (std::is_same_v<T, p::BlockMessage>) {
        os << "  hash: " << msg.hash().to_hex() << "\n"
           << "  txs:  " << msg.block.transactions().size() << "\n";
    } else if constexpr (std::is_same_v<T, p::HeadersMessage>) {
        os << "  headers: " << msg.headers.size() << "\n";
        for (const auto& h : msg.headers) {
            os << "    " << h.hash().to_hex() << "\n";
        }
    } else if constexpr (std::is_same_v<T, p::PingMessage> ||
                         std::is_same_v<T, p::PongMessage>) {
        os << "  nonce: " << msg.nonce << "\n";
    }
}

void print_message(const net::transport::RawNetworkMessage& msg,
                   net::Network expected) {
    auto known = net::network_from_magic(msg.magic);
    std::cout << "network: "
              << (known.has_value() ? std::string(net::network_name(*known))
                                  : "unknown")
              << " (" << hex32(msg.magic) << ")\n"
              << "command: " << msg.command() << "\n";
    std::visit([](const auto& m) { describe(std::cout, m); }, msg.payload);

    if (msg.magic != net::network_magic(expected)) {
        LOG_WARN(core::LogCategory::TOOL,
                 "frame magic " + hex32(msg.magic) + " is not "
                 + std::string(net::network_name(expected)) + " ("
                 + hex32(net::network_magic(expected)) + ")");
    }
}

void print_error(const net::transport::EnvelopeError& err) {
    std::cout << "error:   "
              << net::transport::envelope_error_kind_name(err.kind) << "\n";
    if (!err.command.empty()) {
        std::cout << "command: " << err.command << "\n";
    }
    std::cout << "cause:   " << core::error_code_name(err.cause.code());
    if (!err.cause.message().empty()) {
        std::cout << ": " << err.cause.message();
    }
    std::cout << "\n";
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------
int cmd_decode(const std::string& hex, net::Network network) {
    auto bytes = core::parse_hex_dump(hex);
    if (!bytes.has_value()) {
        std::cerr << "Error: invalid hex input\n";
        return EXIT_USAGE;
    }

    auto result = net::transport::decode_message(*bytes);
    if (!result.ok()) {
        print_error(result.error());
        return EXIT_DECODE;
    }
    print_message(result.value(), network);
    return EXIT_OK;
}

int cmd_split(net::Network network) {
    std::string input((std::istreambuf_iterator<char>(std::cin)),
                      std::istreambuf_iterator<char>());
    auto bytes = core::parse_hex_dump(input);
    if (!bytes.has_value()) {
        std::cerr << "Error: invalid hex input\n";
        return EXIT_USAGE;
    }

    net::transport::FrameReader reader;
    reader.feed(*bytes);

    int status = EXIT_OK;
    size_t count = 0;
    while (auto item = reader.next()) {
        std::cout << "--- frame " << count++ << "\n";
        if (item->ok()) {
            print_message(item->value(), network);
        } else {
            print_error(item->error());
            status = EXIT_DECODE;
        }
    }

    if (reader.buffered() > 0) {
        std::cout << "--- " << reader.buffered()
                  << " bytes left over (incomplete frame)\n";
        status = EXIT_DECODE;
    }
    return status;
}

bool parse_nonce(const std::string& text, uint64_t& out) {
    if (text.empty() || text[0] == '-') return false;
    try {
        size_t pos = 0;
        out = std::stoull(text, &pos, 0);
        return pos == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

int cmd_build(const net::transport::RawNetworkMessage& msg) {
    auto frame = net::transport::encode_message(msg);
    LOG_DEBUG(core::LogCategory::TOOL,
              "built '" + std::string(msg.command()) + "' frame, "
              + std::to_string(frame.size()) + " bytes");
    std::cout << core::to_hex(frame) << "\n";
    return EXIT_OK;
}

} // anonymous namespace

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    core::Config config;
    config.parse_args(argc, argv);

    if (auto conf = config.get(core::CONF_CONF); conf.has_value()) {
        auto rc = config.parse_file(*conf);
        if (!rc.ok()) {
            std::cerr << "Error: " << rc.error().message() << "\n";
            return EXIT_USAGE;
        }
    }

    if (!init_logging(config)) {
        return EXIT_USAGE;
    }

    const auto& args = config.positional();
    if (args.empty()) {
        print_usage();
        return EXIT_USAGE;
    }

    auto network = net::network_from_name(config.network());
    if (!network.ok()) {
        std::cerr << "Error: " << network.error().message() << "\n";
        return EXIT_USAGE;
    }
    uint32_t magic = net::network_magic(network.value());

    LOG_DEBUG(core::LogCategory::TOOL,
              "network " + std::string(net::network_name(network.value()))
              + ", command '" + args[0] + "'");

    const std::string& command = args[0];

    if (command == "decode") {
        if (args.size() != 2) {
            std::cerr << "Usage: satwire-msg decode <hex>\n";
            return EXIT_USAGE;
        }
        return cmd_decode(args[1], network.value());
    }
    if (command == "split") {
        return cmd_split(network.value());
    }
    if (command == "verack") {
        return cmd_build({magic, net::protocol::VerackMessage{}});
    }
    if (command == "ping" || command == "pong") {
        uint64_t nonce = 0;
        if (args.size() != 2 || !parse_nonce(args[1], nonce)) {
            std::cerr << "Usage: satwire-msg " << command << " <nonce>\n";
            return EXIT_USAGE;
        }
        if (command == "ping") {
            return cmd_build({magic, net::protocol::PingMessage{nonce}});
        }
        return cmd_build({magic, net::protocol::PongMessage{nonce}});
    }

    std::cerr << "Unknown command: " << command << "\n"
              << "Run 'satwire-msg' without arguments for help.\n";
    return EXIT_USAGE;
}
