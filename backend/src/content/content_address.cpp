/**
 * ContentAddress text forms.
 *
 * The long forms append one format byte to the 32 hash bytes, so a string
 * can carry both parts without a separator. The short hash-sequence form
 * marks the format with a leading 's' in front of the hex hash.
 */

#include "content/content_address.h"

#include "common/text_encoding.h"

#include <algorithm>
#include <vector>

namespace {

constexpr size_t kWithFormat = Hash::kSize + 1;
constexpr char kHashSeqPrefix = 's';

} // namespace

const char* to_string(BlobFormat format) {
    switch (format) {
        case BlobFormat::Raw:     return "raw";
        case BlobFormat::HashSeq: return "hashseq";
    }
    return "unknown";
}

std::optional<BlobFormat> blob_format_from_u32(uint32_t value) {
    switch (value) {
        case 0: return BlobFormat::Raw;
        case 1: return BlobFormat::HashSeq;
        default: return std::nullopt;
    }
}

std::optional<ContentAddress> ContentAddress::from_string(std::string_view text) {
    if (text.size() == Hash::kSize * 2 + 1 && text.front() == kHashSeqPrefix) {
        auto hash = Hash::from_string(text.substr(1));
        if (!hash) {
            return std::nullopt;
        }
        return hash_seq(*hash);
    }

    std::optional<std::vector<uint8_t>> decoded;
    switch (text.size()) {
        case Hash::kSize * 2:
        case kWithFormat * 2:
            decoded = hex_decode(text);
            break;
        case base32_length(Hash::kSize):
        case base32_length(kWithFormat):
            decoded = base32_decode(text);
            break;
        default:
            return std::nullopt;
    }
    if (!decoded) {
        return std::nullopt;
    }

    BlobFormat format = BlobFormat::Raw;
    if (decoded->size() == kWithFormat) {
        auto parsed = blob_format_from_u32(decoded->back());
        if (!parsed) {
            return std::nullopt;
        }
        format = *parsed;
        decoded->pop_back();
    }
    if (decoded->size() != Hash::kSize) {
        return std::nullopt;
    }

    Hash::Bytes bytes;
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    return ContentAddress{Hash(bytes), format};
}

std::string ContentAddress::to_string() const {
    std::vector<uint8_t> bytes(hash.bytes().begin(), hash.bytes().end());
    bytes.push_back(static_cast<uint8_t>(format));
    return base32_encode(bytes);
}
