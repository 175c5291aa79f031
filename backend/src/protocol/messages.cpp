/**
 * Tracker message codec.
 *
 *   ContentAddress = hash[32] varint(format)
 *   Announce       = host[32] varint(n) ContentAddress*n varint(kind)
 *   Query          = ContentAddress bool(complete) bool(verified)
 *   QueryResponse  = ContentAddress varint(n) PeerId[32]*n
 *   Request        = varint(0) Announce | varint(1) Query
 *   Response       = varint(0) QueryResponse
 */

#include "protocol/messages.h"

#include "common/discovery_error.h"
#include "protocol/wire.h"

#include <string>

namespace {

enum RequestTag : uint32_t { kAnnounceTag = 0, kQueryTag = 1 };
enum ResponseTag : uint32_t { kQueryResponseTag = 0 };

// hash + 1-byte format
constexpr size_t kMinContentAddressSize = Hash::kSize + 1;

void write_content(WireWriter& out, const ContentAddress& content) {
    out.write_array(content.hash.bytes());
    out.write_varint(static_cast<uint32_t>(content.format));
}

ContentAddress read_content(WireReader& in) {
    Hash hash(in.read_array<Hash::kSize>());
    auto format = blob_format_from_u32(in.read_varint_u32());
    if (!format) {
        throw DiscoveryError(ErrorKind::Decoding, "unknown blob format");
    }
    return {hash, *format};
}

void write_payload(WireWriter& out, const Announce& announce) {
    out.write_array(announce.host.bytes());
    out.write_varint(announce.content.size());
    for (const auto& content : announce.content) {
        write_content(out, content);
    }
    out.write_varint(static_cast<uint32_t>(announce.kind));
}

void write_payload(WireWriter& out, const Query& query) {
    write_content(out, query.content);
    out.write_bool(query.flags.complete);
    out.write_bool(query.flags.verified);
}

void write_payload(WireWriter& out, const QueryResponse& response) {
    write_content(out, response.content);
    out.write_varint(response.hosts.size());
    for (const auto& host : response.hosts) {
        out.write_array(host.bytes());
    }
}

Announce read_announce(WireReader& in) {
    Announce announce;
    announce.host = PeerId(in.read_array<PeerId::kSize>());
    size_t count = in.read_length(kMinContentAddressSize);
    for (size_t i = 0; i < count; ++i) {
        announce.content.insert(read_content(in));
    }
    switch (in.read_varint_u32()) {
        case 0: announce.kind = AnnounceKind::Partial; break;
        case 1: announce.kind = AnnounceKind::Complete; break;
        default:
            throw DiscoveryError(ErrorKind::Decoding, "unknown announce kind");
    }
    return announce;
}

Query read_query(WireReader& in) {
    Query query;
    query.content = read_content(in);
    query.flags.complete = in.read_bool();
    query.flags.verified = in.read_bool();
    return query;
}

QueryResponse read_query_response(WireReader& in) {
    QueryResponse response;
    response.content = read_content(in);
    size_t count = in.read_length(PeerId::kSize);
    response.hosts.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        response.hosts.emplace_back(in.read_array<PeerId::kSize>());
    }
    return response;
}

} // namespace

const char* to_string(AnnounceKind kind) {
    switch (kind) {
        case AnnounceKind::Partial:  return "partial";
        case AnnounceKind::Complete: return "complete";
    }
    return "unknown";
}

std::vector<uint8_t> encode_request(const Request& request) {
    if (request.valueless_by_exception()) {
        throw DiscoveryError(ErrorKind::Encoding, "cannot encode an empty request");
    }
    WireWriter out;
    out.write_varint(request.index());
    std::visit([&out](const auto& payload) { write_payload(out, payload); }, request);
    return out.take();
}

std::vector<uint8_t> encode_response(const Response& response) {
    if (response.valueless_by_exception()) {
        throw DiscoveryError(ErrorKind::Encoding, "cannot encode an empty response");
    }
    WireWriter out;
    out.write_varint(response.index());
    std::visit([&out](const auto& payload) { write_payload(out, payload); }, response);
    return out.take();
}

Request decode_request(const std::vector<uint8_t>& bytes) {
    WireReader in(bytes);
    uint32_t tag = in.read_varint_u32();

    Request request;
    switch (tag) {
        case kAnnounceTag:
            request = read_announce(in);
            break;
        case kQueryTag:
            request = read_query(in);
            break;
        default:
            throw DiscoveryError(ErrorKind::Decoding,
                                 "unknown request tag " + std::to_string(tag));
    }
    in.expect_end();
    return request;
}

Response decode_response(const std::vector<uint8_t>& bytes) {
    WireReader in(bytes);
    uint32_t tag = in.read_varint_u32();

    Response response;
    switch (tag) {
        case kQueryResponseTag:
            response = read_query_response(in);
            break;
        default:
            throw DiscoveryError(ErrorKind::Decoding,
                                 "unknown response tag " + std::to_string(tag));
    }
    in.expect_end();
    return response;
}
