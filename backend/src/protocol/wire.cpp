#include "protocol/wire.h"

#include "common/discovery_error.h"

#include <cstring>
#include <limits>

namespace {

[[noreturn]] void fail(const std::string& what) {
    throw DiscoveryError(ErrorKind::Decoding, "malformed message: " + what);
}

} // namespace

void WireWriter::write_varint(uint64_t value) {
    while (value >= 0x80) {
        buffer_.push_back(static_cast<uint8_t>(value | 0x80));
        value >>= 7;
    }
    buffer_.push_back(static_cast<uint8_t>(value));
}

void WireWriter::write_bytes(const uint8_t* data, size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

void WireWriter::write_string(const std::string& value) {
    write_varint(value.size());
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

uint8_t WireReader::read_u8() {
    if (pos_ >= size_) {
        fail("unexpected end of input");
    }
    return data_[pos_++];
}

bool WireReader::read_bool() {
    uint8_t value = read_u8();
    if (value > 1) {
        fail("invalid bool byte " + std::to_string(value));
    }
    return value == 1;
}

uint32_t WireReader::read_varint_u32() {
    return static_cast<uint32_t>(read_varint(5, std::numeric_limits<uint32_t>::max()));
}

uint64_t WireReader::read_varint_u64() {
    return read_varint(10, std::numeric_limits<uint64_t>::max());
}

uint64_t WireReader::read_varint(unsigned max_bytes, uint64_t max_value) {
    uint64_t value = 0;
    for (unsigned i = 0; i < max_bytes; ++i) {
        uint8_t byte = read_u8();
        unsigned shift = 7 * i;
        uint64_t chunk = byte & 0x7f;
        if (shift > 0 && (chunk >> (64 - shift)) != 0) {
            fail("varint overflow");
        }
        value |= chunk << shift;
        if ((byte & 0x80) == 0) {
            if (value > max_value) {
                fail("varint out of range");
            }
            return value;
        }
    }
    fail("varint too long");
}

std::string WireReader::read_string() {
    // read_length has checked the bytes are there.
    size_t length = read_length(1);
    std::string out(data_ + pos_, data_ + pos_ + length);
    pos_ += length;
    return out;
}

size_t WireReader::read_length(size_t min_element_size) {
    uint64_t length = read_varint_u64();
    if (min_element_size > 0 && length > remaining() / min_element_size) {
        fail("sequence length " + std::to_string(length) + " exceeds input");
    }
    return static_cast<size_t>(length);
}

void WireReader::expect_end() const {
    if (pos_ != size_) {
        fail(std::to_string(size_ - pos_) + " trailing bytes");
    }
}

void WireReader::read_into(uint8_t* out, size_t count) {
    if (count > remaining()) {
        fail("unexpected end of input");
    }
    if (count == 0) {
        return;
    }
    std::memcpy(out, data_ + pos_, count);
    pos_ += count;
}
