#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * Identity of a network participant: its Ed25519 public key.
 *
 * Only equality is meaningful. operator< exists so ids can live in
 * ordered containers.
 */
class PeerId {
public:
    static constexpr size_t kSize = 32;
    using Bytes = std::array<uint8_t, kSize>;

    PeerId() = default;
    explicit PeerId(const Bytes& bytes) : bytes_(bytes) {}

    /// Parse the base32 (canonical) or hex form.
    static std::optional<PeerId> from_string(std::string_view text);

    [[nodiscard]] std::string to_string() const;
    /// First ten characters of the base32 form, for log lines.
    [[nodiscard]] std::string short_string() const;
    [[nodiscard]] const Bytes& bytes() const { return bytes_; }

    bool operator==(const PeerId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const PeerId& other) const { return bytes_ != other.bytes_; }
    bool operator<(const PeerId& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_{};
};
