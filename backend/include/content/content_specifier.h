#pragma once

#include "content/blob_ticket.h"
#include "content/content_address.h"
#include "content/hash.h"
#include "content/peer_id.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

/**
 * A user-supplied way of naming content: a bare hash, an explicit
 * (hash, format) address, or a ticket that also names the host.
 */
class ContentSpecifier {
public:
    using Value = std::variant<Hash, ContentAddress, BlobTicket>;

    ContentSpecifier(Hash hash) : value_(hash) {}
    ContentSpecifier(ContentAddress address) : value_(address) {}
    ContentSpecifier(BlobTicket ticket) : value_(std::move(ticket)) {}

    /**
     * Try a bare hash, then a content address, then a ticket, and keep the
     * first that parses. Throws DiscoveryError(SpecifierParse) if none do.
     */
    static ContentSpecifier parse(std::string_view text);

    /// Hash resolves as Raw; a ticket as its own (hash, format).
    [[nodiscard]] ContentAddress address() const;

    /// Hosting peer, only known for tickets.
    [[nodiscard]] std::optional<PeerId> host() const;

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] const Value& value() const { return value_; }

    [[nodiscard]] bool is_ticket() const { return std::holds_alternative<BlobTicket>(value_); }

private:
    Value value_;
};
