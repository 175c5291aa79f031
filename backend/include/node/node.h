#pragma once

#include "config/app_config.h"
#include "content/content_specifier.h"
#include "content/peer_id.h"
#include "network/tcp_transport.h"
#include "protocol/messages.h"
#include "tracker/tracker_client.h"

#include <optional>
#include <vector>

/**
 * Represents the local discovery node: owns the transport and the tracker
 * client and turns command-level arguments into protocol requests.
 */
class Node {
public:
    explicit Node(const AppConfig& config);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /**
     * Announce content to `tracker`.
     *
     * With `host`, one announcement covers all content (possibly none).
     * Without it, every specifier must be a ticket and one announcement is
     * sent per ticket host. Returns the announcements that were sent.
     */
    std::vector<Announce> announce(const PeerId& tracker,
                                   const std::vector<ContentSpecifier>& content,
                                   bool partial,
                                   const std::optional<PeerId>& host);

    /// Ask `tracker` for hosts of `content`.
    QueryResponse query(const PeerId& tracker,
                        const ContentSpecifier& content,
                        bool partial,
                        bool verified);

    /// Group specifiers into announcements without sending them.
    static std::vector<Announce> build_announcements(const std::vector<ContentSpecifier>& content,
                                                     AnnounceKind kind,
                                                     const std::optional<PeerId>& host);

private:
    TcpTransport transport_;
    TrackerClient client_;
};
