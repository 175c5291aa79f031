#pragma once

#include "crypto/crypto_manager.h"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * Async TCP server that accepts peer connections and answers one request
 * per connection.
 *
 * The server proves its identity with `identity` during the handshake,
 * reads the request until the client half-closes, and writes whatever the
 * handler for the negotiated protocol returns. A connection that makes no
 * progress for the idle timeout is closed.
 */
class PeerServer {
public:
    using RequestHandler =
        std::function<std::vector<uint8_t>(const std::vector<uint8_t>& request)>;

    PeerServer(asio::io_context& io,
               const CryptoManager& identity,
               const asio::ip::tcp::endpoint& listen);

    void start();
    /// Call from the thread running the io_context, or after it stopped.
    void stop();

    /// Serve `protocol` with `handler`. Connections for other tags are closed.
    void set_on_request(const std::string& protocol, RequestHandler handler);

    /// Bound port; useful when listening on port 0.
    [[nodiscard]] uint16_t port() const;

    /// Largest request body accepted.
    void set_request_limit(size_t limit) { request_limit_ = limit; }

    /// How long a session may wait for the next bytes from its client.
    void set_idle_timeout(std::chrono::milliseconds timeout) { idle_timeout_ = timeout; }

private:
    void do_accept();

    asio::ip::tcp::acceptor acceptor_;
    const CryptoManager& identity_;
    std::map<std::string, RequestHandler> handlers_;
    size_t request_limit_;
    std::chrono::milliseconds idle_timeout_;
};
