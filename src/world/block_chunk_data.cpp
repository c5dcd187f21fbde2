// regionmap World Format
// block_chunk_data.cpp - 10-bit packed heightmap and biome tint arrays

#include <regionmap/core/logger.hpp>
#include <regionmap/world/block_chunk_data.hpp>
#include <regionmap/world/byte_cursor.hpp>

namespace regionmap::world {

std::vector<uint16_t> unpack_ten_bit_indices(std::span<const uint8_t> bytes, size_t count) {
    std::vector<uint16_t> values(count, 0);

    for (size_t i = 0; i < count; ++i) {
        const size_t bit_offset = i * 10;
        const size_t byte_offset = bit_offset / 8;
        const unsigned bit_in_byte = static_cast<unsigned>(bit_offset % 8);

        const uint32_t byte1 = byte_offset < bytes.size() ? bytes[byte_offset] : 0;
        const uint32_t byte2 = byte_offset + 1 < bytes.size() ? bytes[byte_offset + 1] : 0;

        values[i] = static_cast<uint16_t>(((byte1 >> bit_in_byte) | (byte2 << (8 - bit_in_byte))) & 0x3FF);
    }

    return values;
}

std::vector<uint8_t> pack_ten_bit_indices(std::span<const uint16_t> values) {
    std::vector<uint8_t> bytes((values.size() * 10 + 7) / 8, 0);

    for (size_t i = 0; i < values.size(); ++i) {
        const uint32_t value = values[i] & 0x3FF;
        const size_t bit_offset = i * 10;
        const size_t byte_offset = bit_offset / 8;
        const unsigned bit_in_byte = static_cast<unsigned>(bit_offset % 8);

        bytes[byte_offset] |= static_cast<uint8_t>((value << bit_in_byte) & 0xFF);
        if (byte_offset + 1 < bytes.size()) {
            bytes[byte_offset + 1] |= static_cast<uint8_t>((value >> (8 - bit_in_byte)) & 0xFF);
        }
    }

    return bytes;
}

BlockChunkData decode_block_chunk_data(std::span<const uint8_t> bytes) {
    ByteCursor cursor(bytes);
    BlockChunkData data;

    data.needs_physics = cursor.read_u8() != 0;

    // Heightmap
    std::vector<uint16_t> height_palette(cursor.read_u16(Endian::Little));
    for (auto& height : height_palette) {
        height = cursor.read_u16(Endian::Little);
    }
    auto height_packed = cursor.read_bytes(cursor.read_u32(Endian::Little));
    if (height_packed.size() != TEN_BIT_PACKED_SIZE) {
        REGIONMAP_LOG_DEBUG(core::log_category::FORMAT, "Heightmap packed array is {} bytes, expected {}",
                            height_packed.size(), TEN_BIT_PACKED_SIZE);
    }

    auto height_indices = unpack_ten_bit_indices(height_packed);
    for (size_t i = 0; i < COLUMNS_PER_CHUNK; ++i) {
        const uint16_t index = height_indices[i];
        data.heights[i] = index < height_palette.size() ? height_palette[index] : 0;
    }

    // Biome tint
    std::vector<uint32_t> tint_palette(cursor.read_u16(Endian::Little));
    for (auto& tint : tint_palette) {
        tint = cursor.read_u32(Endian::Little);
    }
    auto tint_packed = cursor.read_bytes(cursor.read_u32(Endian::Little));
    if (tint_packed.size() != TEN_BIT_PACKED_SIZE) {
        REGIONMAP_LOG_DEBUG(core::log_category::FORMAT, "Tint packed array is {} bytes, expected {}",
                            tint_packed.size(), TEN_BIT_PACKED_SIZE);
    }

    auto tint_indices = unpack_ten_bit_indices(tint_packed);
    for (size_t i = 0; i < COLUMNS_PER_CHUNK; ++i) {
        const uint16_t index = tint_indices[i];
        data.tints[i] = index < tint_palette.size() ? TintColor::from_packed(tint_palette[index]) : TintColor{};
    }

    return data;
}

}  // namespace regionmap::world
