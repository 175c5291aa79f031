/**
 * Node - Represents the local discovery node.
 *
 * Builds the TCP transport from the configured address book and issues
 * announces and queries through the tracker client.
 */

#include "node/node.h"

#include "common/discovery_error.h"

#include <spdlog/spdlog.h>

#include <map>
#include <utility>

Node::Node(const AppConfig& config)
    : transport_(config.peers, config.transport),
      client_(transport_) {}

std::vector<Announce> Node::build_announcements(const std::vector<ContentSpecifier>& content,
                                                AnnounceKind kind,
                                                const std::optional<PeerId>& host) {
    if (host) {
        Announce announce;
        announce.host = *host;
        announce.kind = kind;
        for (const auto& specifier : content) {
            announce.content.insert(specifier.address());
        }
        return {announce};
    }

    if (content.empty()) {
        throw DiscoveryError(ErrorKind::Usage, "--host is required when no ticket is given");
    }

    std::map<PeerId, Announce> by_host;
    for (const auto& specifier : content) {
        auto ticket_host = specifier.host();
        if (!ticket_host) {
            throw DiscoveryError(ErrorKind::Usage,
                                 "--host is required unless all content is given as tickets ('" +
                                 specifier.to_string() + "' is not a ticket)");
        }
        auto& announce = by_host[*ticket_host];
        announce.host = *ticket_host;
        announce.kind = kind;
        announce.content.insert(specifier.address());
    }

    std::vector<Announce> out;
    out.reserve(by_host.size());
    for (auto& entry : by_host) {
        out.push_back(std::move(entry.second));
    }
    return out;
}

std::vector<Announce> Node::announce(const PeerId& tracker,
                                     const std::vector<ContentSpecifier>& content,
                                     bool partial,
                                     const std::optional<PeerId>& host) {
    auto announcements =
        build_announcements(content, announce_kind_from_complete(!partial), host);
    for (const auto& announce : announcements) {
        spdlog::info("announcing {} item(s) for host {} to tracker {}",
                     announce.content.size(), announce.host.to_string(), tracker.to_string());
        client_.announce(tracker, announce);
    }
    return announcements;
}

QueryResponse Node::query(const PeerId& tracker,
                          const ContentSpecifier& content,
                          bool partial,
                          bool verified) {
    Query request;
    request.content = content.address();
    request.flags.complete = !partial;
    request.flags.verified = verified;

    spdlog::info("querying tracker {} for {}", tracker.to_string(), request.content.to_string());
    return client_.query(tracker, request);
}
