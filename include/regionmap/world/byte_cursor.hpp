// regionmap World Format
// byte_cursor.hpp - Bounds-checked sequential reader over a byte buffer

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace regionmap::world {

enum class Endian : uint8_t { Big, Little };

// Reads fixed-width integers and byte runs from a non-owning buffer.
// Every read is bounds-checked and throws DecodeError(CorruptFormat) with the
// failing offset and requested length; the cursor does not move on failure.
class ByteCursor {
public:
    explicit ByteCursor(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] uint8_t read_u8();
    [[nodiscard]] int8_t read_i8();
    [[nodiscard]] uint16_t read_u16(Endian endian);
    [[nodiscard]] uint32_t read_u32(Endian endian);

    // Sub-span of the underlying buffer, valid as long as the buffer is
    [[nodiscard]] std::span<const uint8_t> read_bytes(size_t count);
    [[nodiscard]] std::string read_string(size_t length);

    void skip(size_t count);
    void seek(size_t position);

    [[nodiscard]] size_t position() const { return position_; }
    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] size_t remaining() const { return data_.size() - position_; }
    [[nodiscard]] bool can_read(size_t count) const { return count <= remaining(); }

private:
    void require(size_t count) const;

    std::span<const uint8_t> data_;
    size_t position_ = 0;
};

}  // namespace regionmap::world
