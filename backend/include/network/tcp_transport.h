#pragma once

#include "network/address_book.h"
#include "network/transport.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct TransportOptions {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds io_timeout{10000};
    /// Bind outgoing connections to this local port. The OS picks one when unset.
    std::optional<uint16_t> local_port;
};

/**
 * Transport over plain TCP. Peers are located through the address book;
 * every connect() opens a new socket.
 */
class TcpTransport : public Transport {
public:
    TcpTransport(AddressBook addresses, TransportOptions options);

    std::unique_ptr<Connection> connect(const PeerId& peer,
                                        const std::string& protocol) override;

    [[nodiscard]] const AddressBook& addresses() const { return addresses_; }

private:
    const AddressBook addresses_;
    const TransportOptions options_;
};
