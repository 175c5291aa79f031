/**
 * PeerClient - Connects to a remote peer and exposes one byte stream.
 *
 * Blocking calls are built from asio async operations driven by
 * io_context::run_for, so a stalled peer costs at most one timeout and the
 * socket is closed when it fires.
 */

#include "network/peer_client.h"

#include "common/discovery_error.h"
#include "crypto/crypto_manager.h"
#include "network/handshake.h"

#include <sodium.h>
#include <spdlog/spdlog.h>
#include <utility>

using asio::ip::tcp;

struct PeerClient::Channel {
    explicit Channel(std::chrono::milliseconds timeout) : io_timeout(timeout) {}

    asio::io_context io;
    tcp::socket socket{io};
    std::chrono::milliseconds io_timeout;

    void run(std::chrono::milliseconds timeout, const std::string& what) {
        io.restart();
        io.run_for(timeout);
        if (!io.stopped()) {
            // Deadline hit: closing the socket aborts the pending operation.
            asio::error_code ignored;
            socket.close(ignored);
            io.run();
            throw DiscoveryError(ErrorKind::Connection, what + " timed out");
        }
    }

    /// Connect to `remote` from a fixed local port. Failures are returned, a
    /// timeout throws like every other step.
    asio::error_code connect_from(uint16_t local_port, const tcp::endpoint& remote,
                                  std::chrono::milliseconds timeout, const std::string& what) {
        asio::error_code ec;
        socket.close(ec);
        socket.open(remote.protocol(), ec);
        if (ec) {
            return ec;
        }
        socket.set_option(tcp::socket::reuse_address(true), ec);
        if (ec) {
            return ec;
        }
        socket.bind(tcp::endpoint(remote.protocol(), local_port), ec);
        if (ec) {
            return ec;
        }

        asio::error_code result = asio::error::would_block;
        socket.async_connect(remote, [&result](const asio::error_code& e) { result = e; });
        run(timeout, what);
        return result;
    }

    void write(const std::vector<uint8_t>& bytes) {
        asio::error_code result = asio::error::would_block;
        asio::async_write(socket, asio::buffer(bytes),
                          [&result](const asio::error_code& ec, size_t) { result = ec; });
        run(io_timeout, "write");
        if (result) {
            throw DiscoveryError(ErrorKind::Connection, "write failed: " + result.message());
        }
    }

    std::vector<uint8_t> read_exact(size_t size) {
        std::vector<uint8_t> out(size);
        asio::error_code result = asio::error::would_block;
        asio::async_read(socket, asio::buffer(out),
                         [&result](const asio::error_code& ec, size_t) { result = ec; });
        run(io_timeout, "read");
        if (result == asio::error::eof) {
            throw DiscoveryError(ErrorKind::Connection, "connection closed by peer");
        }
        if (result) {
            throw DiscoveryError(ErrorKind::Connection, "read failed: " + result.message());
        }
        return out;
    }

    size_t read_some(uint8_t* buffer, size_t size) {
        asio::error_code result = asio::error::would_block;
        size_t count = 0;
        socket.async_read_some(asio::buffer(buffer, size),
                               [&result, &count](const asio::error_code& ec, size_t n) {
                                   result = ec;
                                   count = n;
                               });
        run(io_timeout, "read");
        if (result == asio::error::eof) {
            return 0;
        }
        if (result) {
            throw DiscoveryError(ErrorKind::Connection, "read failed: " + result.message());
        }
        return count;
    }

    void shutdown_send() {
        asio::error_code ec;
        socket.shutdown(tcp::socket::shutdown_send, ec);
        if (ec) {
            throw DiscoveryError(ErrorKind::Connection, "finish failed: " + ec.message());
        }
    }

    void close() {
        asio::error_code ignored;
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }
};

namespace {

class PeerStream : public BiStream {
public:
    explicit PeerStream(std::shared_ptr<PeerClient::Channel> channel)
        : channel_(std::move(channel)) {}

    void write_all(const std::vector<uint8_t>& bytes) override { channel_->write(bytes); }
    void finish() override { channel_->shutdown_send(); }
    size_t read_some(uint8_t* buffer, size_t size) override {
        return channel_->read_some(buffer, size);
    }

private:
    std::shared_ptr<PeerClient::Channel> channel_;
};

} // namespace

PeerClient::PeerClient(const PeerId& peer,
                       std::chrono::milliseconds connect_timeout,
                       std::chrono::milliseconds io_timeout)
    : peer_(peer),
      connect_timeout_(connect_timeout),
      channel_(std::make_shared<Channel>(io_timeout)) {}

PeerClient::~PeerClient() {
    disconnect();
}

void PeerClient::connect(const std::vector<tcp::endpoint>& endpoints,
                         const std::string& protocol) {
    if (endpoints.empty()) {
        throw DiscoveryError(ErrorKind::Connection,
                             "no address known for peer " + peer_.to_string());
    }
    if (!CryptoManager::init()) {
        throw DiscoveryError(ErrorKind::Connection, "libsodium initialisation failed");
    }

    asio::error_code result = asio::error::would_block;
    tcp::endpoint reached;
    if (local_port_) {
        for (const auto& endpoint : endpoints) {
            result = channel_->connect_from(*local_port_, endpoint, connect_timeout_,
                                            "connect to " + peer_.short_string());
            if (!result) {
                reached = endpoint;
                break;
            }
            spdlog::debug("connect to {}:{} from port {} failed: {}",
                          endpoint.address().to_string(), endpoint.port(), *local_port_,
                          result.message());
        }
    } else {
        asio::async_connect(channel_->socket, endpoints,
                            [&result, &reached](const asio::error_code& ec,
                                                const tcp::endpoint& ep) {
                                result = ec;
                                reached = ep;
                            });
        channel_->run(connect_timeout_, "connect to " + peer_.short_string());
    }
    if (result) {
        throw DiscoveryError(ErrorKind::Connection,
                             "cannot connect to " + peer_.short_string() + ": " + result.message());
    }
    spdlog::debug("connected to {} at {}:{}", peer_.short_string(),
                  reached.address().to_string(), reached.port());

    Nonce nonce;
    randombytes_buf(nonce.data(), nonce.size());
    channel_->write(encode_handshake_hello(protocol, nonce));

    std::vector<uint8_t> reply;
    try {
        reply = channel_->read_exact(kHandshakeReplySize);
    } catch (const DiscoveryError& e) {
        throw DiscoveryError(ErrorKind::Connection,
                             "peer " + peer_.short_string() + " rejected protocol '" +
                             protocol + "': " + e.what());
    }
    verify_handshake_reply(reply, peer_, protocol, nonce);
    connected_ = true;
}

std::unique_ptr<BiStream> PeerClient::open_bi() {
    if (!connected_) {
        throw DiscoveryError(ErrorKind::Connection, "open_bi on an unconnected peer");
    }
    if (stream_opened_) {
        throw DiscoveryError(ErrorKind::Connection, "TCP connection carries a single stream");
    }
    stream_opened_ = true;
    return std::make_unique<PeerStream>(channel_);
}

void PeerClient::disconnect() {
    if (channel_) {
        channel_->close();
    }
    connected_ = false;
}
