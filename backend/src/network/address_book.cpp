#include "network/address_book.h"

#include "common/discovery_error.h"

#include <algorithm>

using asio::ip::tcp;

void AddressBook::add(const PeerId& peer, const tcp::endpoint& endpoint) {
    auto& endpoints = entries_[peer];
    if (std::find(endpoints.begin(), endpoints.end(), endpoint) == endpoints.end()) {
        endpoints.push_back(endpoint);
    }
}

std::vector<tcp::endpoint> AddressBook::lookup(const PeerId& peer) const {
    auto it = entries_.find(peer);
    if (it == entries_.end()) {
        return {};
    }
    return it->second;
}

std::vector<tcp::endpoint> AddressBook::parse_endpoints(const std::string& text) {
    auto bad = [&text](const std::string& why) {
        return DiscoveryError(ErrorKind::Config, "invalid endpoint '" + text + "': " + why);
    };

    std::string host;
    std::string port_text;
    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            throw bad("expected [address]:port");
        }
        host = text.substr(1, close - 1);
        port_text = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string::npos) {
            throw bad("missing port");
        }
        host = text.substr(0, colon);
        port_text = text.substr(colon + 1);
    }

    if (host.empty() || port_text.empty() ||
        !std::all_of(port_text.begin(), port_text.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
        port_text.size() > 5) {
        throw bad("expected host:port");
    }
    unsigned long port = std::stoul(port_text);
    if (port == 0 || port > 0xffff) {
        throw bad("port out of range");
    }

    asio::error_code ec;
    auto address = asio::ip::make_address(host, ec);
    if (!ec) {
        return {tcp::endpoint(address, static_cast<uint16_t>(port))};
    }

    asio::io_context io;
    tcp::resolver resolver(io);
    auto results = resolver.resolve(host, port_text, ec);
    if (ec) {
        throw bad(ec.message());
    }
    std::vector<tcp::endpoint> endpoints;
    for (const auto& entry : results) {
        endpoints.push_back(entry.endpoint());
    }
    if (endpoints.empty()) {
        throw bad("host has no addresses");
    }
    return endpoints;
}
