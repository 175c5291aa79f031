#include "content/peer_id.h"

#include "common/text_encoding.h"

#include <algorithm>

std::optional<PeerId> PeerId::from_string(std::string_view text) {
    std::optional<std::vector<uint8_t>> decoded;
    if (text.size() == base32_length(kSize)) {
        decoded = base32_decode(text);
    } else if (text.size() == kSize * 2) {
        decoded = hex_decode(text);
    }
    if (!decoded || decoded->size() != kSize) {
        return std::nullopt;
    }

    Bytes bytes;
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    return PeerId(bytes);
}

std::string PeerId::to_string() const {
    return base32_encode(bytes_.data(), bytes_.size());
}

std::string PeerId::short_string() const {
    return to_string().substr(0, 10);
}
