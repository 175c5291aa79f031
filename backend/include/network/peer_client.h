#pragma once

#include "content/peer_id.h"
#include "network/transport.h"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * TCP connection to a single remote peer.
 *
 * Owns a private io_context so each connection is independent of every
 * other call in the process. Every blocking step runs under a deadline;
 * on expiry the socket is closed and the step throws.
 */
class PeerClient : public Connection {
public:
    PeerClient(const PeerId& peer,
               std::chrono::milliseconds connect_timeout,
               std::chrono::milliseconds io_timeout);
    ~PeerClient() override;

    PeerClient(const PeerClient&) = delete;
    PeerClient& operator=(const PeerClient&) = delete;

    /// Bind to `port` before connecting instead of an ephemeral port.
    void set_local_port(uint16_t port) { local_port_ = port; }

    /// Connect to the first reachable endpoint, then prove the remote is
    /// `peer` and that it serves `protocol`.
    void connect(const std::vector<asio::ip::tcp::endpoint>& endpoints,
                 const std::string& protocol);

    /// The connection carries exactly one stream; a second call throws.
    std::unique_ptr<BiStream> open_bi() override;

    void disconnect();

    struct Channel;

private:
    PeerId peer_;
    std::chrono::milliseconds connect_timeout_;
    std::optional<uint16_t> local_port_;
    std::shared_ptr<Channel> channel_;
    bool connected_ = false;
    bool stream_opened_ = false;
};
