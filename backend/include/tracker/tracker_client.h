#pragma once

#include "content/peer_id.h"
#include "network/transport.h"
#include "protocol/messages.h"

#include <string>

struct ClientOptions {
    /// Tag both ends present to select the tracker protocol.
    std::string protocol = kTrackerProtocol;
    /// Hard cap on response bytes.
    size_t response_limit = kMessageSizeLimit;
};

/**
 * Talks to a tracker. Every call is one self-contained exchange on a fresh
 * connection: connect, open a stream, write the request, half-close, read
 * the response until the tracker closes.
 *
 * Holds no mutable state, so calls from several threads may run at once.
 * Failures surface as DiscoveryError; nothing is retried.
 */
class TrackerClient {
public:
    explicit TrackerClient(Transport& transport, ClientOptions options = {});

    /// Tell `tracker` that a host has some content.
    void announce(const PeerId& tracker, const Announce& request) const;

    /// Ask `tracker` which hosts claim to have some content.
    QueryResponse query(const PeerId& tracker, const Query& request) const;

    [[nodiscard]] const ClientOptions& options() const { return options_; }

private:
    std::vector<uint8_t> exchange(const PeerId& tracker, const Request& request) const;

    Transport& transport_;
    const ClientOptions options_;
};
