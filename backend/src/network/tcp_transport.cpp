#include "network/tcp_transport.h"

#include "common/discovery_error.h"
#include "network/peer_client.h"

#include <utility>

TcpTransport::TcpTransport(AddressBook addresses, TransportOptions options)
    : addresses_(std::move(addresses)), options_(options) {}

std::unique_ptr<Connection> TcpTransport::connect(const PeerId& peer,
                                                  const std::string& protocol) {
    auto endpoints = addresses_.lookup(peer);
    if (endpoints.empty()) {
        throw DiscoveryError(ErrorKind::Connection,
                             "no address known for peer " + peer.to_string() +
                             " (add it to \"peers\" in the config or pass --tracker-addr)");
    }

    auto client = std::make_unique<PeerClient>(peer, options_.connect_timeout, options_.io_timeout);
    if (options_.local_port) {
        client->set_local_port(*options_.local_port);
    }
    client->connect(endpoints, protocol);
    return client;
}
