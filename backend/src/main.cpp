/**
 * content-discovery - command line entry point.
 *
 *   content-discovery [--config <file>] [--verbose] <command> [options]
 *
 *   announce  --tracker <peer> [--tracker-addr <host:port>] [--host <peer>]
 *             [--partial] [--magic-port <port>] [content...]
 *   query     --tracker <peer> [--tracker-addr <host:port>] [--partial]
 *             [--verified] [--magic-port <port>] <content>
 *   query-dht <content> [--partial] [--verified] [--query-parallelism <n>]
 *             [--quinn-port <port>]
 *
 * Content is a hash, a hash and format, or a ticket.
 */

#include "common/discovery_error.h"
#include "config/app_config.h"
#include "content/content_specifier.h"
#include "content/peer_id.h"
#include "crypto/crypto_manager.h"
#include "network/address_book.h"
#include "node/node.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
    std::string config_path = "config.json";
    bool config_given = false;
    bool verbose = false;
    std::string command;

    std::optional<PeerId> tracker;
    std::vector<std::string> tracker_addrs;
    std::optional<PeerId> host;
    bool partial = false;
    bool verified = false;
    std::optional<size_t> query_parallelism;
    std::optional<uint16_t> local_port;
    std::vector<ContentSpecifier> content;
};

void print_usage() {
    std::cerr <<
        "usage: content-discovery [--config <file>] [--verbose] <command> [options]\n"
        "\n"
        "  announce  --tracker <peer> [--tracker-addr <host:port>] [--host <peer>]\n"
        "            [--partial] [--magic-port <port>] [content...]\n"
        "  query     --tracker <peer> [--tracker-addr <host:port>] [--partial]\n"
        "            [--verified] [--magic-port <port>] <content>\n"
        "  query-dht <content> [--partial] [--verified] [--query-parallelism <n>]\n"
        "            [--quinn-port <port>]\n"
        "\n"
        "content is a hash, a hash and format, or a blob ticket.\n";
}

[[noreturn]] void usage_error(const std::string& message) {
    throw DiscoveryError(ErrorKind::Usage, message);
}

PeerId parse_peer(const std::string& flag, const std::string& text) {
    auto id = PeerId::from_string(text);
    if (!id) {
        usage_error(flag + ": invalid peer id '" + text + "'");
    }
    return *id;
}

uint16_t parse_port(const std::string& flag, const std::string& text) {
    unsigned long port = 0;
    try {
        size_t used = 0;
        port = std::stoul(text, &used);
        if (used != text.size()) {
            usage_error(flag + ": not a port '" + text + "'");
        }
    } catch (const std::logic_error&) {
        usage_error(flag + ": not a port '" + text + "'");
    }
    if (port > 65535) {
        usage_error(flag + ": port out of range '" + text + "'");
    }
    return static_cast<uint16_t>(port);
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    std::vector<std::string> args(argv + 1, argv + argc);

    size_t i = 0;
    auto value_of = [&args, &i](const std::string& flag) -> const std::string& {
        if (i + 1 >= args.size()) {
            usage_error(flag + " needs a value");
        }
        return args[++i];
    };

    for (; i < args.size() && cli.command.empty(); ++i) {
        const auto& arg = args[i];
        if (arg == "--config") {
            cli.config_path = value_of(arg);
            cli.config_given = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cli.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            usage_error("unknown option " + arg);
        } else {
            cli.command = arg;
        }
    }
    if (cli.command.empty()) {
        usage_error("missing command");
    }
    if (cli.command != "announce" && cli.command != "query" && cli.command != "query-dht") {
        usage_error("unknown command " + cli.command);
    }

    std::vector<std::string> positional;
    for (; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--tracker" && cli.command != "query-dht") {
            cli.tracker = parse_peer(arg, value_of(arg));
        } else if (arg == "--tracker-addr" && cli.command != "query-dht") {
            cli.tracker_addrs.push_back(value_of(arg));
        } else if (arg == "--host" && cli.command == "announce") {
            cli.host = parse_peer(arg, value_of(arg));
        } else if (arg == "--partial") {
            cli.partial = true;
        } else if (arg == "--verified" && cli.command != "announce") {
            cli.verified = true;
        } else if (arg == "--query-parallelism" && cli.command == "query-dht") {
            const auto& text = value_of(arg);
            try {
                cli.query_parallelism = std::stoul(text);
            } catch (const std::logic_error&) {
                usage_error(arg + ": not a number '" + text + "'");
            }
        } else if (arg == "--magic-port" && cli.command != "query-dht") {
            cli.local_port = parse_port(arg, value_of(arg));
        } else if (arg == "--quinn-port" && cli.command == "query-dht") {
            cli.local_port = parse_port(arg, value_of(arg));
        } else if (arg == "--verbose" || arg == "-v") {
            cli.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            usage_error("unknown option " + arg + " for " + cli.command);
        } else {
            positional.push_back(arg);
        }
    }

    for (const auto& text : positional) {
        cli.content.push_back(ContentSpecifier::parse(text));
    }

    if (cli.command != "query-dht" && !cli.tracker) {
        usage_error(cli.command + " needs --tracker");
    }
    if (cli.command != "announce" && cli.content.size() != 1) {
        usage_error(cli.command + " takes exactly one content argument");
    }
    return cli;
}

int run(const CommandLine& cli) {
    AppConfig config = AppConfig::load(cli.config_path, !cli.config_given);
    spdlog::set_level(cli.verbose ? spdlog::level::debug : config.log_level);
    spdlog::debug("loaded config from {}", cli.config_path);

    if (cli.command == "query-dht") {
        // Tracker-less lookup lives in a separate DHT component.
        spdlog::error("query-dht: DHT discovery is not available in this build; "
                      "use query --tracker instead");
        return kExitFailure;
    }

    if (cli.local_port) {
        config.transport.local_port = cli.local_port;
    }
    for (const auto& text : cli.tracker_addrs) {
        for (const auto& endpoint : AddressBook::parse_endpoints(text)) {
            config.peers.add(*cli.tracker, endpoint);
        }
    }

    if (!CryptoManager::init()) {
        spdlog::error("libsodium initialisation failed");
        return kExitFailure;
    }

    Node node(config);

    if (cli.command == "announce") {
        auto sent = node.announce(*cli.tracker, cli.content, cli.partial, cli.host);
        for (const auto& announce : sent) {
            std::cout << "announced " << announce.content.size() << " item(s) for "
                      << announce.host.to_string() << " as " << to_string(announce.kind) << "\n";
        }
        return 0;
    }

    auto response = node.query(*cli.tracker, cli.content.front(), cli.partial, cli.verified);
    spdlog::info("{} host(s) for {}", response.hosts.size(), response.content.to_string());
    for (const auto& host : response.hosts) {
        std::cout << host.to_string() << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    try {
        return run(parse_command_line(argc, argv));
    } catch (const DiscoveryError& e) {
        spdlog::error("{}", e.what());
        if (e.kind() == ErrorKind::Usage || e.kind() == ErrorKind::SpecifierParse) {
            print_usage();
            return kExitUsage;
        }
        return kExitFailure;
    }
}
