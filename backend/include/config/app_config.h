#pragma once

#include "network/address_book.h"
#include "network/tcp_transport.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>

/**
 * Settings read from the JSON config file. Every key is optional.
 *
 *   {
 *     "log_level": "info",
 *     "connect_timeout_ms": 5000,
 *     "io_timeout_ms": 10000,
 *     "peers": { "<peer id>": ["127.0.0.1:4919"] }
 *   }
 */
struct AppConfig {
    spdlog::level::level_enum log_level = spdlog::level::info;
    TransportOptions transport;
    AddressBook peers;

    /// Throws DiscoveryError(Config) on wrong types or invalid values.
    static AppConfig from_json(const nlohmann::json& json);

    /// Read and parse `path`. A missing file is an error unless
    /// `missing_ok`, in which case the defaults are returned.
    static AppConfig load(const std::string& path, bool missing_ok);
};
