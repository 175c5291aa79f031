#pragma once

#include "content/peer_id.h"

#include <asio.hpp>
#include <map>
#include <string>
#include <vector>

/**
 * Known TCP endpoints per peer. Filled once from configuration and
 * read-only afterwards.
 */
class AddressBook {
public:
    void add(const PeerId& peer, const asio::ip::tcp::endpoint& endpoint);

    /// Endpoints for `peer` in insertion order; empty if unknown.
    [[nodiscard]] std::vector<asio::ip::tcp::endpoint> lookup(const PeerId& peer) const;

    [[nodiscard]] bool contains(const PeerId& peer) const { return entries_.count(peer) > 0; }
    [[nodiscard]] size_t size() const { return entries_.size(); }

    /**
     * Parse "1.2.3.4:port", "[::1]:port" or "hostname:port". Host names are
     * resolved immediately and may yield several endpoints.
     * Throws DiscoveryError(Config) on bad input or failed resolution.
     */
    static std::vector<asio::ip::tcp::endpoint> parse_endpoints(const std::string& text);

private:
    std::map<PeerId, std::vector<asio::ip::tcp::endpoint>> entries_;
};
