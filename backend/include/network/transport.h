#pragma once

#include "content/peer_id.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/**
 * Connection-oriented transport seam used by the tracker client.
 *
 * Implementations report every failure as DiscoveryError(Connection).
 */

/**
 * One bidirectional byte stream. The send side can be closed on its own
 * to mark the end of a message.
 */
class BiStream {
public:
    virtual ~BiStream() = default;

    virtual void write_all(const std::vector<uint8_t>& bytes) = 0;

    /// Half-close: no more bytes will be written.
    virtual void finish() = 0;

    /// Read up to `size` bytes. Returns 0 once the peer closed its side.
    virtual size_t read_some(uint8_t* buffer, size_t size) = 0;

    /**
     * Read until the peer closes its side. More than `limit` bytes is
     * DiscoveryError(ResponseTooLarge); the data is never truncated.
     */
    std::vector<uint8_t> read_to_end(size_t limit);
};

class Connection {
public:
    virtual ~Connection() = default;

    virtual std::unique_ptr<BiStream> open_bi() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    /// Open a fresh connection to `peer`, selecting `protocol` on it.
    virtual std::unique_ptr<Connection> connect(const PeerId& peer,
                                                const std::string& protocol) = 0;
};
