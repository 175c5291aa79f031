#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * Compact field-order binary encoding shared by protocol messages and
 * tickets.
 *
 *   unsigned ints, lengths, enum tags : LEB128 varint
 *   bool                              : one byte, 0 or 1
 *   fixed arrays                      : raw bytes, no prefix
 *   option                            : 0 | 1 followed by the value
 *   sequences, strings                : varint count, then elements
 *
 * Nothing is self-describing; both sides must agree on field order.
 */
class WireWriter {
public:
    void write_u8(uint8_t value) { buffer_.push_back(value); }
    void write_bool(bool value) { buffer_.push_back(value ? 1 : 0); }
    void write_varint(uint64_t value);
    void write_bytes(const uint8_t* data, size_t size);
    void write_string(const std::string& value);

    template <size_t N>
    void write_array(const std::array<uint8_t, N>& bytes) {
        write_bytes(bytes.data(), N);
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * Cursor over an encoded buffer. Every read throws
 * DiscoveryError(ErrorKind::Decoding) on truncated or malformed input.
 */
class WireReader {
public:
    WireReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit WireReader(const std::vector<uint8_t>& data)
        : WireReader(data.data(), data.size()) {}

    uint8_t read_u8();
    bool read_bool();
    uint32_t read_varint_u32();
    uint64_t read_varint_u64();
    std::string read_string();

    /// Read a sequence length that must be satisfiable with the remaining
    /// input, at `min_element_size` bytes per element.
    size_t read_length(size_t min_element_size);

    template <size_t N>
    std::array<uint8_t, N> read_array() {
        std::array<uint8_t, N> out;
        read_into(out.data(), N);
        return out;
    }

    [[nodiscard]] size_t remaining() const { return size_ - pos_; }

    /// Throws if any input is left over.
    void expect_end() const;

private:
    void read_into(uint8_t* out, size_t count);
    uint64_t read_varint(unsigned max_bytes, uint64_t max_value);

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};
