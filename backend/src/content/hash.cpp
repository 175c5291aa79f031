#include "content/hash.h"

#include "common/text_encoding.h"

#include <algorithm>

std::optional<Hash> Hash::from_string(std::string_view text) {
    std::optional<std::vector<uint8_t>> decoded;
    if (text.size() == kSize * 2) {
        decoded = hex_decode(text);
    } else if (text.size() == base32_length(kSize)) {
        decoded = base32_decode(text);
    }
    if (!decoded || decoded->size() != kSize) {
        return std::nullopt;
    }

    Bytes bytes;
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    return Hash(bytes);
}

std::string Hash::to_string() const {
    return base32_encode(bytes_.data(), bytes_.size());
}

std::string Hash::to_hex() const {
    return hex_encode(bytes_.data(), bytes_.size());
}
