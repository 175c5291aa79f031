#pragma once

#include "content/hash.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * How the bytes behind a hash are interpreted.
 */
enum class BlobFormat : uint8_t {
    Raw = 0,      ///< a single blob
    HashSeq = 1,  ///< a sequence of hashes; the set of blobs it references
};

const char* to_string(BlobFormat format);

/// Map a wire discriminant to a format. std::nullopt for unknown values.
std::optional<BlobFormat> blob_format_from_u32(uint32_t value);

/**
 * Canonical identity of a piece of content: (hash, format).
 * Ordering is by hash, then format.
 */
struct ContentAddress {
    Hash hash;
    BlobFormat format = BlobFormat::Raw;

    static ContentAddress raw(const Hash& hash) { return {hash, BlobFormat::Raw}; }
    static ContentAddress hash_seq(const Hash& hash) { return {hash, BlobFormat::HashSeq}; }

    /**
     * Parse `hash || format_byte` as 66 hex or 53 base32 characters.
     * The plain 32-byte hash forms are accepted too and mean Raw, and
     * 's' followed by 64 hex characters means HashSeq.
     */
    static std::optional<ContentAddress> from_string(std::string_view text);

    /// 53-character base32 form of `hash || format_byte`.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ContentAddress& other) const {
        return hash == other.hash && format == other.format;
    }
    bool operator!=(const ContentAddress& other) const { return !(*this == other); }
    bool operator<(const ContentAddress& other) const {
        if (hash != other.hash) return hash < other.hash;
        return format < other.format;
    }
};
