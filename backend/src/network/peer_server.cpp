/**
 * PeerServer - Listens for incoming TCP connections from other peers.
 *
 * Uses standalone ASIO for async I/O. Each connection gets its own
 * session that runs the handshake, reads the request until the client
 * half-closes, passes it to the protocol handler and writes the reply.
 * A per-session deadline, pushed back whenever the client sends bytes,
 * closes connections that stall. The server must outlive the io_context run that drives its sessions.
 */

#include "network/peer_server.h"

#include "common/discovery_error.h"
#include "network/handshake.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <utility>

using asio::ip::tcp;

namespace {

constexpr size_t kDefaultRequestLimit = 16 * 1024;
constexpr std::chrono::milliseconds kDefaultIdleTimeout{10000};

using Handlers = std::map<std::string, PeerServer::RequestHandler>;

class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
    PeerSession(tcp::socket socket, const CryptoManager& identity,
                const Handlers& handlers, size_t request_limit,
                std::chrono::milliseconds idle_timeout)
        : socket_(std::move(socket)),
          deadline_(socket_.get_executor()),
          identity_(identity),
          handlers_(handlers),
          request_limit_(request_limit),
          idle_timeout_(idle_timeout) {}

    void start() {
        arm_deadline();
        read_tag_length();
    }

private:
    void arm_deadline() {
        deadline_.expires_after(idle_timeout_);
        auto self = shared_from_this();
        deadline_.async_wait([self](const asio::error_code& ec) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            // The deadline may have been pushed back after this wait completed.
            if (self->deadline_.expiry() > std::chrono::steady_clock::now()) {
                return;
            }
            self->close("idle timeout");
        });
    }

    void read_tag_length() {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(&tag_length_, 1),
                         [self](const asio::error_code& ec, size_t) {
                             if (ec || self->tag_length_ == 0) {
                                 self->close("bad handshake");
                                 return;
                             }
                             self->read_hello();
                         });
    }

    void read_hello() {
        hello_.resize(tag_length_ + kNonceSize);
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(hello_),
                         [self](const asio::error_code& ec, size_t) {
                             if (ec) {
                                 self->close("truncated handshake");
                                 return;
                             }
                             self->select_protocol();
                         });
    }

    void select_protocol() {
        protocol_.assign(hello_.begin(), hello_.begin() + tag_length_);
        std::copy(hello_.begin() + tag_length_, hello_.end(), nonce_.begin());

        auto it = handlers_.find(protocol_);
        if (it == handlers_.end()) {
            spdlog::warn("peer requested unknown protocol '{}'", protocol_);
            close("unknown protocol");
            return;
        }
        handler_ = &it->second;
        write_handshake_reply();
    }

    void write_handshake_reply() {
        reply_ = encode_handshake_reply(identity_, protocol_, nonce_);
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(reply_),
                          [self](const asio::error_code& ec, size_t) {
                              if (ec) {
                                  self->close("handshake write failed");
                                  return;
                              }
                              self->read_request();
                          });
    }

    void read_request() {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(chunk_),
                                [self](const asio::error_code& ec, size_t n) {
                                    if (ec == asio::error::eof) {
                                        self->dispatch();
                                        return;
                                    }
                                    if (ec) {
                                        self->close("read failed: " + ec.message());
                                        return;
                                    }
                                    self->arm_deadline();
                                    self->request_.insert(self->request_.end(),
                                                          self->chunk_.begin(),
                                                          self->chunk_.begin() + n);
                                    if (self->request_.size() > self->request_limit_) {
                                        spdlog::warn("dropping request larger than {} bytes",
                                                     self->request_limit_);
                                        self->close("request too large");
                                        return;
                                    }
                                    self->read_request();
                                });
    }

    void dispatch() {
        try {
            response_ = (*handler_)(request_);
        } catch (const std::exception& e) {
            spdlog::warn("{} handler failed: {}", protocol_, e.what());
            close("handler error");
            return;
        }

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(response_),
                          [self](const asio::error_code& ec, size_t) {
                              if (ec) {
                                  self->close("response write failed");
                                  return;
                              }
                              asio::error_code ignored;
                              self->socket_.shutdown(tcp::socket::shutdown_send, ignored);
                              self->close("done");
                          });
    }

    void close(const std::string& reason) {
        spdlog::debug("closing session: {}", reason);
        deadline_.cancel();
        asio::error_code ignored;
        socket_.close(ignored);
    }

    tcp::socket socket_;
    asio::steady_timer deadline_;
    const CryptoManager& identity_;
    const Handlers& handlers_;
    const PeerServer::RequestHandler* handler_ = nullptr;
    size_t request_limit_;
    std::chrono::milliseconds idle_timeout_;

    uint8_t tag_length_ = 0;
    std::vector<uint8_t> hello_;
    std::string protocol_;
    Nonce nonce_{};
    std::vector<uint8_t> reply_;
    std::array<uint8_t, 4096> chunk_{};
    std::vector<uint8_t> request_;
    std::vector<uint8_t> response_;
};

} // namespace

PeerServer::PeerServer(asio::io_context& io,
                       const CryptoManager& identity,
                       const tcp::endpoint& listen)
    : acceptor_(io, listen),
      identity_(identity),
      request_limit_(kDefaultRequestLimit),
      idle_timeout_(kDefaultIdleTimeout) {}

void PeerServer::start() {
    if (!identity_.has_keypair()) {
        throw DiscoveryError(ErrorKind::Config, "peer server needs a key pair");
    }
    spdlog::info("listening on {}:{} as {}",
                 acceptor_.local_endpoint().address().to_string(), port(),
                 identity_.node_id().to_string());
    do_accept();
}

void PeerServer::stop() {
    asio::error_code ignored;
    acceptor_.close(ignored);
}

void PeerServer::set_on_request(const std::string& protocol, RequestHandler handler) {
    handlers_[protocol] = std::move(handler);
}

uint16_t PeerServer::port() const {
    asio::error_code ec;
    auto local = acceptor_.local_endpoint(ec);
    return ec ? 0 : local.port();
}

void PeerServer::do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::warn("accept failed: {}", ec.message());
        } else {
            asio::error_code remote_ec;
            auto remote = socket.remote_endpoint(remote_ec);
            if (!remote_ec) {
                spdlog::debug("accepted connection from {}", remote.address().to_string());
            }
            std::make_shared<PeerSession>(std::move(socket), identity_, handlers_,
                                          request_limit_, idle_timeout_)->start();
        }
        if (acceptor_.is_open()) {
            do_accept();
        }
    });
}
