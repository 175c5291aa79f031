#pragma once

#include "common/discovery_error.h"
#include "network/transport.h"

#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * In-memory transport for exercising the tracker client.
 *
 * Records what the client does and plays back a canned response in small
 * chunks. With `close_after_response` false the stream reports a timeout
 * once the response is drained, like a tracker that never closes.
 */
class FakeTransport : public Transport {
public:
    struct Log {
        std::vector<std::string> events;
        std::vector<std::string> protocols;
        std::vector<uint8_t> received;
        size_t connects = 0;
    };

    std::vector<uint8_t> response;
    size_t chunk_size = 1000;
    bool close_after_response = true;
    bool fail_connect = false;

    std::unique_ptr<Connection> connect(const PeerId& peer,
                                        const std::string& protocol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.connects++;
        log_.protocols.push_back(protocol);
        log_.events.push_back("connect " + peer.short_string());
        if (fail_connect) {
            throw DiscoveryError(ErrorKind::Connection, "connection refused");
        }
        return std::make_unique<FakeConnection>(*this);
    }

    Log log() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_;
    }

private:
    class FakeStream : public BiStream {
    public:
        explicit FakeStream(FakeTransport& owner) : owner_(owner) {}

        void write_all(const std::vector<uint8_t>& bytes) override {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.log_.events.push_back("write");
            owner_.log_.received = bytes;
        }

        void finish() override {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.log_.events.push_back("finish");
        }

        size_t read_some(uint8_t* buffer, size_t size) override {
            if (!read_started_) {
                std::lock_guard<std::mutex> lock(owner_.mutex_);
                owner_.log_.events.push_back("read");
                read_started_ = true;
            }
            const auto& data = owner_.response;
            if (offset_ == data.size()) {
                if (!owner_.close_after_response) {
                    throw DiscoveryError(ErrorKind::Connection, "read timed out");
                }
                return 0;
            }
            size_t n = std::min({size, owner_.chunk_size, data.size() - offset_});
            std::memcpy(buffer, data.data() + offset_, n);
            offset_ += n;
            return n;
        }

    private:
        FakeTransport& owner_;
        size_t offset_ = 0;
        bool read_started_ = false;
    };

    class FakeConnection : public Connection {
    public:
        explicit FakeConnection(FakeTransport& owner) : owner_(owner) {}

        std::unique_ptr<BiStream> open_bi() override {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.log_.events.push_back("open_bi");
            return std::make_unique<FakeStream>(owner_);
        }

    private:
        FakeTransport& owner_;
    };

    mutable std::mutex mutex_;
    Log log_;
};
