/**
 * ContentSpecifier - ordered parse and normalization of content arguments.
 *
 * A 64-character hex string is both a valid hash and a valid raw address;
 * the ordering below makes it a hash.
 */

#include "content/content_specifier.h"

#include "common/discovery_error.h"

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

ContentSpecifier ContentSpecifier::parse(std::string_view text) {
    if (auto hash = Hash::from_string(text)) {
        return ContentSpecifier(*hash);
    }
    if (auto address = ContentAddress::from_string(text)) {
        return ContentSpecifier(*address);
    }
    if (auto ticket = BlobTicket::from_string(text)) {
        return ContentSpecifier(std::move(*ticket));
    }
    throw DiscoveryError(ErrorKind::SpecifierParse,
                         "invalid content '" + std::string(text) +
                         "': expected a hash, a hash and format, or a ticket");
}

ContentAddress ContentSpecifier::address() const {
    return std::visit(overloaded{
        [](const Hash& hash) { return ContentAddress::raw(hash); },
        [](const ContentAddress& address) { return address; },
        [](const BlobTicket& ticket) { return ticket.content(); },
    }, value_);
}

std::optional<PeerId> ContentSpecifier::host() const {
    if (const auto* ticket = std::get_if<BlobTicket>(&value_)) {
        return ticket->node_addr().node_id;
    }
    return std::nullopt;
}

std::string ContentSpecifier::to_string() const {
    return std::visit([](const auto& v) { return v.to_string(); }, value_);
}
