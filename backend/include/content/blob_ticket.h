#pragma once

#include "content/content_address.h"
#include "content/hash.h"
#include "content/peer_id.h"

#include <asio.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

/**
 * How to reach a peer: its id plus whatever addresses are known for it.
 */
struct NodeAddr {
    PeerId node_id;
    std::optional<std::string> relay_url;
    std::set<asio::ip::tcp::endpoint> direct_addresses;

    bool operator==(const NodeAddr& other) const {
        return node_id == other.node_id && relay_url == other.relay_url &&
               direct_addresses == other.direct_addresses;
    }
};

/**
 * Self-contained content specifier: a content address together with the
 * peer that hosts it.
 *
 * Text form is "blob" followed by the base32 encoding of the ticket's wire
 * bytes.
 */
class BlobTicket {
public:
    static constexpr std::string_view kPrefix = "blob";

    BlobTicket(NodeAddr node, const Hash& hash, BlobFormat format);

    static std::optional<BlobTicket> from_string(std::string_view text);
    static BlobTicket from_bytes(const std::vector<uint8_t>& bytes);

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] std::vector<uint8_t> to_bytes() const;

    [[nodiscard]] const NodeAddr& node_addr() const { return node_; }
    [[nodiscard]] const Hash& hash() const { return hash_; }
    [[nodiscard]] BlobFormat format() const { return format_; }
    [[nodiscard]] ContentAddress content() const { return {hash_, format_}; }

    bool operator==(const BlobTicket& other) const {
        return node_ == other.node_ && hash_ == other.hash_ && format_ == other.format_;
    }

private:
    NodeAddr node_;
    Hash hash_;
    BlobFormat format_;
};
