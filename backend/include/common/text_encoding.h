#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * Text forms for identifiers: lowercase hex and RFC 4648 base32 without
 * padding. Decoders accept either case and return std::nullopt on any
 * malformed input.
 */

std::string hex_encode(const uint8_t* data, size_t size);
std::string hex_encode(const std::vector<uint8_t>& data);

/// Decode hex text; fails on odd length or non-hex characters.
std::optional<std::vector<uint8_t>> hex_decode(std::string_view text);

std::string base32_encode(const uint8_t* data, size_t size);
std::string base32_encode(const std::vector<uint8_t>& data);

/// Decode unpadded base32; fails on bad characters, impossible lengths or
/// non-zero trailing bits.
std::optional<std::vector<uint8_t>> base32_decode(std::string_view text);

/// Number of base32 characters needed for `bytes` bytes without padding.
constexpr size_t base32_length(size_t bytes) { return (bytes * 8 + 4) / 5; }
