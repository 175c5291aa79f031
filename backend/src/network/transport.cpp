#include "network/transport.h"

#include "common/discovery_error.h"

#include <algorithm>
#include <array>
#include <limits>
#include <string>

std::vector<uint8_t> BiStream::read_to_end(size_t limit) {
    std::vector<uint8_t> out;
    std::array<uint8_t, 4096> chunk;

    for (;;) {
        // Ask for one byte past the limit so an oversized body is detected
        // instead of being cut off at exactly `limit`. An unbounded limit has
        // no byte past it.
        size_t room = limit - out.size();
        if (room != std::numeric_limits<size_t>::max()) {
            ++room;
        }
        size_t n = read_some(chunk.data(), std::min(room, chunk.size()));
        if (n == 0) {
            return out;
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + n);
        if (out.size() > limit) {
            throw DiscoveryError(ErrorKind::ResponseTooLarge,
                                 "message exceeds " + std::to_string(limit) + " bytes");
        }
    }
}
