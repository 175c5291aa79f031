#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * 32-byte content digest identifying a blob's bytes.
 *
 * Text forms: 52 base32 characters (canonical) or 64 hex characters.
 */
class Hash {
public:
    static constexpr size_t kSize = 32;
    using Bytes = std::array<uint8_t, kSize>;

    Hash() = default;
    explicit Hash(const Bytes& bytes) : bytes_(bytes) {}

    /// Parse the base32 or hex form. Returns std::nullopt on anything else.
    static std::optional<Hash> from_string(std::string_view text);

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] const Bytes& bytes() const { return bytes_; }

    bool operator==(const Hash& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Hash& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Hash& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_{};
};
