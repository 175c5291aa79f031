#pragma once

#include "content/content_address.h"
#include "content/peer_id.h"

#include <cstdint>
#include <set>
#include <variant>
#include <vector>

/**
 * Tracker protocol messages.
 *
 * A client sends one Request per stream and half-closes; the tracker
 * answers with one Response (nothing meaningful for an announce).
 */

/// Protocol tag both ends present when the connection is set up.
inline constexpr char kTrackerProtocol[] = "n0/tracker/1";

/// Upper bound for a single request or response body.
inline constexpr size_t kMessageSizeLimit = 16 * 1024;

enum class AnnounceKind : uint8_t {
    Partial = 0,   ///< the host has some of the data
    Complete = 1,  ///< the host has all data reachable from the address
};

inline AnnounceKind announce_kind_from_complete(bool complete) {
    return complete ? AnnounceKind::Complete : AnnounceKind::Partial;
}

const char* to_string(AnnounceKind kind);

/**
 * A claim that `host` holds `content`. The announcing peer need not be the
 * host itself.
 */
struct Announce {
    PeerId host;
    std::set<ContentAddress> content;
    AnnounceKind kind = AnnounceKind::Complete;

    bool operator==(const Announce& other) const {
        return host == other.host && content == other.content && kind == other.kind;
    }
};

struct QueryFlags {
    /// Only hosts that claimed to have the complete data.
    bool complete = true;
    /// Only hosts the tracker has checked itself. For partial queries that
    /// means the host answered with a size; for complete queries it was
    /// probed for random chunks.
    bool verified = false;

    bool operator==(const QueryFlags& other) const {
        return complete == other.complete && verified == other.verified;
    }
};

struct Query {
    ContentAddress content;
    QueryFlags flags;

    bool operator==(const Query& other) const {
        return content == other.content && flags == other.flags;
    }
};

struct QueryResponse {
    ContentAddress content;
    /// In tracker order; may contain duplicates.
    std::vector<PeerId> hosts;

    bool operator==(const QueryResponse& other) const {
        return content == other.content && hosts == other.hosts;
    }
};

using Request = std::variant<Announce, Query>;
using Response = std::variant<QueryResponse>;

std::vector<uint8_t> encode_request(const Request& request);
std::vector<uint8_t> encode_response(const Response& response);

/// Both throw DiscoveryError(ErrorKind::Decoding) on unknown tags,
/// truncated input or trailing bytes.
Request decode_request(const std::vector<uint8_t>& bytes);
Response decode_response(const std::vector<uint8_t>& bytes);
