/**
 * BlobTicket - content address plus hosting node, serialized with the
 * protocol's wire primitives and wrapped in base32 text.
 *
 * Layout:
 *   varint(0)                     ticket variant
 *   node_id[32]
 *   option<string> relay_url
 *   varint(n) socket addresses    varint(0) ip4[4] | varint(1) ip6[16], varint(port)
 *   varint(format)
 *   hash[32]
 */

#include "content/blob_ticket.h"

#include "common/discovery_error.h"
#include "common/text_encoding.h"
#include "protocol/wire.h"

#include <utility>

namespace {

constexpr uint32_t kTicketVariant = 0;
constexpr uint32_t kSocketV4 = 0;
constexpr uint32_t kSocketV6 = 1;

// Smallest encoded socket address: tag + 4 bytes + 1-byte port.
constexpr size_t kMinSocketSize = 6;

void write_endpoint(WireWriter& out, const asio::ip::tcp::endpoint& ep) {
    const asio::ip::address addr = ep.address();
    if (addr.is_v4()) {
        out.write_varint(kSocketV4);
        auto bytes = addr.to_v4().to_bytes();
        out.write_bytes(bytes.data(), bytes.size());
    } else {
        out.write_varint(kSocketV6);
        auto bytes = addr.to_v6().to_bytes();
        out.write_bytes(bytes.data(), bytes.size());
    }
    out.write_varint(ep.port());
}

asio::ip::tcp::endpoint read_endpoint(WireReader& in) {
    asio::ip::address addr;
    switch (in.read_varint_u32()) {
        case kSocketV4:
            addr = asio::ip::address_v4(in.read_array<4>());
            break;
        case kSocketV6:
            addr = asio::ip::address_v6(in.read_array<16>());
            break;
        default:
            throw DiscoveryError(ErrorKind::Decoding, "ticket: unknown socket address kind");
    }
    uint32_t port = in.read_varint_u32();
    if (port > 0xffff) {
        throw DiscoveryError(ErrorKind::Decoding, "ticket: port out of range");
    }
    return {addr, static_cast<uint16_t>(port)};
}

} // namespace

BlobTicket::BlobTicket(NodeAddr node, const Hash& hash, BlobFormat format)
    : node_(std::move(node)), hash_(hash), format_(format) {}

std::vector<uint8_t> BlobTicket::to_bytes() const {
    WireWriter out;
    out.write_varint(kTicketVariant);
    out.write_array(node_.node_id.bytes());
    if (node_.relay_url) {
        out.write_u8(1);
        out.write_string(*node_.relay_url);
    } else {
        out.write_u8(0);
    }
    out.write_varint(node_.direct_addresses.size());
    for (const auto& ep : node_.direct_addresses) {
        write_endpoint(out, ep);
    }
    out.write_varint(static_cast<uint32_t>(format_));
    out.write_array(hash_.bytes());
    return out.take();
}

BlobTicket BlobTicket::from_bytes(const std::vector<uint8_t>& bytes) {
    WireReader in(bytes);
    if (in.read_varint_u32() != kTicketVariant) {
        throw DiscoveryError(ErrorKind::Decoding, "ticket: unknown variant");
    }

    NodeAddr node;
    node.node_id = PeerId(in.read_array<PeerId::kSize>());
    switch (in.read_u8()) {
        case 0:
            break;
        case 1:
            node.relay_url = in.read_string();
            break;
        default:
            throw DiscoveryError(ErrorKind::Decoding, "ticket: invalid option tag");
    }
    size_t count = in.read_length(kMinSocketSize);
    for (size_t i = 0; i < count; ++i) {
        node.direct_addresses.insert(read_endpoint(in));
    }

    auto format = blob_format_from_u32(in.read_varint_u32());
    if (!format) {
        throw DiscoveryError(ErrorKind::Decoding, "ticket: unknown blob format");
    }
    Hash hash(in.read_array<Hash::kSize>());
    in.expect_end();

    return BlobTicket(std::move(node), hash, *format);
}

std::optional<BlobTicket> BlobTicket::from_string(std::string_view text) {
    if (text.substr(0, kPrefix.size()) != kPrefix) {
        return std::nullopt;
    }
    auto bytes = base32_decode(text.substr(kPrefix.size()));
    if (!bytes) {
        return std::nullopt;
    }
    try {
        return from_bytes(*bytes);
    } catch (const DiscoveryError&) {
        // Not a well-formed ticket; the caller decides what that means.
        return std::nullopt;
    }
}

std::string BlobTicket::to_string() const {
    return std::string(kPrefix) + base32_encode(to_bytes());
}
