/**
 * Hex (via libsodium's constant-time helpers) and base32 text codecs.
 */

#include "common/text_encoding.h"

#include <sodium.h>

namespace {

constexpr char kBase32Alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";

int base32_value(char c) {
    if (c >= 'a' && c <= 'z') return c - 'a';
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return c - '2' + 26;
    return -1;
}

} // namespace

std::string hex_encode(const uint8_t* data, size_t size) {
    std::string out(size * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data, size);
    out.resize(size * 2);
    return out;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    return hex_encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> hex_decode(std::string_view text) {
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out(text.size() / 2);
    size_t written = 0;
    // A null hex_end makes libsodium fail on the first non-hex character.
    if (sodium_hex2bin(out.data(), out.size(), text.data(), text.size(),
                       nullptr, &written, nullptr) != 0) {
        return std::nullopt;
    }
    if (written != out.size()) {
        return std::nullopt;
    }
    return out;
}

std::string base32_encode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(base32_length(size));

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < size; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1f]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1f]);
    }
    return out;
}

std::string base32_encode(const std::vector<uint8_t>& data) {
    return base32_encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> base32_decode(std::string_view text) {
    // 5 * n mod 8 leftover bits must be fewer than a full character.
    if ((text.size() * 5) % 8 >= 5) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int value = base32_value(c);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xff));
            bits -= 8;
        }
    }
    // Non-canonical input: padding bits must be zero.
    if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }
    return out;
}
