#include "config/app_config.h"

#include "common/discovery_error.h"

#include <chrono>
#include <fstream>

using json = nlohmann::json;

namespace {

std::chrono::milliseconds read_timeout(const json& config, const char* key,
                                       std::chrono::milliseconds fallback) {
    if (!config.contains(key)) {
        return fallback;
    }
    const auto& value = config.at(key);
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
        throw DiscoveryError(ErrorKind::Config,
                             std::string(key) + " must be a positive integer");
    }
    return std::chrono::milliseconds(value.get<long long>());
}

} // namespace

AppConfig AppConfig::from_json(const json& config) {
    if (!config.is_object()) {
        throw DiscoveryError(ErrorKind::Config, "config must be a JSON object");
    }

    AppConfig out;

    if (config.contains("log_level")) {
        const auto& level = config.at("log_level");
        if (!level.is_string()) {
            throw DiscoveryError(ErrorKind::Config, "log_level must be a string");
        }
        auto name = level.get<std::string>();
        out.log_level = spdlog::level::from_str(name);
        // from_str maps unknown names to "off"; only accept that when asked for.
        if (out.log_level == spdlog::level::off && name != "off") {
            throw DiscoveryError(ErrorKind::Config, "unknown log_level '" + name + "'");
        }
    }

    out.transport.connect_timeout =
        read_timeout(config, "connect_timeout_ms", out.transport.connect_timeout);
    out.transport.io_timeout =
        read_timeout(config, "io_timeout_ms", out.transport.io_timeout);

    if (config.contains("peers")) {
        const auto& peers = config.at("peers");
        if (!peers.is_object()) {
            throw DiscoveryError(ErrorKind::Config, "peers must be an object");
        }
        for (const auto& [id_text, addresses] : peers.items()) {
            auto id = PeerId::from_string(id_text);
            if (!id) {
                throw DiscoveryError(ErrorKind::Config, "invalid peer id '" + id_text + "'");
            }
            if (!addresses.is_array()) {
                throw DiscoveryError(ErrorKind::Config,
                                     "addresses of " + id_text + " must be an array");
            }
            for (const auto& address : addresses) {
                if (!address.is_string()) {
                    throw DiscoveryError(ErrorKind::Config,
                                         "addresses of " + id_text + " must be strings");
                }
                for (const auto& endpoint : AddressBook::parse_endpoints(address.get<std::string>())) {
                    out.peers.add(*id, endpoint);
                }
            }
        }
    }

    return out;
}

AppConfig AppConfig::load(const std::string& path, bool missing_ok) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (missing_ok) {
            return AppConfig{};
        }
        throw DiscoveryError(ErrorKind::Config, "cannot open config file: " + path);
    }

    json config;
    try {
        config = json::parse(file);
    } catch (const json::parse_error& e) {
        throw DiscoveryError(ErrorKind::Config, "cannot parse " + path + ": " + e.what());
    }
    return from_json(config);
}
