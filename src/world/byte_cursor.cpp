// regionmap World Format
// byte_cursor.cpp - Bounds-checked sequential reader

#include <regionmap/world/byte_cursor.hpp>
#include <regionmap/world/decode_error.hpp>

#include <spdlog/fmt/fmt.h>

namespace regionmap::world {

void ByteCursor::require(size_t count) const {
    if (!can_read(count)) {
        throw DecodeError(DecodeErrorCode::CorruptFormat,
                          fmt::format("read of {} bytes at offset {} overruns buffer of {} bytes", count, position_,
                                      data_.size()),
                          position_, count);
    }
}

uint8_t ByteCursor::read_u8() {
    require(1);
    return data_[position_++];
}

int8_t ByteCursor::read_i8() {
    return static_cast<int8_t>(read_u8());
}

uint16_t ByteCursor::read_u16(Endian endian) {
    require(2);
    const uint8_t* p = data_.data() + position_;
    position_ += 2;
    if (endian == Endian::Big) {
        return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
    }
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

uint32_t ByteCursor::read_u32(Endian endian) {
    require(4);
    const uint8_t* p = data_.data() + position_;
    position_ += 4;
    if (endian == Endian::Big) {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

std::span<const uint8_t> ByteCursor::read_bytes(size_t count) {
    require(count);
    auto result = data_.subspan(position_, count);
    position_ += count;
    return result;
}

std::string ByteCursor::read_string(size_t length) {
    auto bytes = read_bytes(length);
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

void ByteCursor::skip(size_t count) {
    require(count);
    position_ += count;
}

void ByteCursor::seek(size_t position) {
    if (position > data_.size()) {
        throw DecodeError(DecodeErrorCode::CorruptFormat,
                          fmt::format("seek to {} past end of {} byte buffer", position, data_.size()), position, 0);
    }
    position_ = position;
}

}  // namespace regionmap::world
