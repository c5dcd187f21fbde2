// regionmap World Format
// block_chunk_data.hpp - 10-bit packed heightmap and biome tint arrays

#pragma once

#include "types.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace regionmap::world {

inline constexpr size_t TEN_BIT_INDEX_COUNT = COLUMNS_PER_CHUNK;
inline constexpr size_t TEN_BIT_PACKED_SIZE = TEN_BIT_INDEX_COUNT * 10 / 8;  // 1280

// Unpack `count` little-endian-bit-ordered 10-bit values. Bytes past the end
// of the buffer read as zero.
[[nodiscard]] std::vector<uint16_t> unpack_ten_bit_indices(std::span<const uint8_t> bytes,
                                                           size_t count = TEN_BIT_INDEX_COUNT);

// Inverse of unpack_ten_bit_indices; values are masked to 10 bits
[[nodiscard]] std::vector<uint8_t> pack_ten_bit_indices(std::span<const uint16_t> values);

// Packed 0xRRGGBB
struct TintColor {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;

    [[nodiscard]] static TintColor from_packed(uint32_t rgb) {
        return {static_cast<uint8_t>((rgb >> 16) & 0xFF), static_cast<uint8_t>((rgb >> 8) & 0xFF),
                static_cast<uint8_t>(rgb & 0xFF)};
    }

    bool operator==(const TintColor&) const = default;
};

// Per-chunk column data decoded from the BlockChunk blob.
// The two arrays use different column orderings and must stay that way:
// heights are indexed x + z*32, tints are indexed z + x*32.
struct BlockChunkData {
    bool needs_physics = false;
    std::array<uint16_t, COLUMNS_PER_CHUNK> heights{};
    std::array<TintColor, COLUMNS_PER_CHUNK> tints{};

    [[nodiscard]] uint16_t height_at(int32_t x, int32_t z) const {
        return heights[static_cast<size_t>((x & 31) + (z & 31) * CHUNK_SIZE)];
    }

    [[nodiscard]] TintColor tint_at(int32_t x, int32_t z) const {
        return tints[static_cast<size_t>((z & 31) + (x & 31) * CHUNK_SIZE)];
    }
};

// Little-endian blob layout:
//   needs_physics u8
//   height palette: count u16, count x u16, packed length u32, packed bytes
//   tint palette:   count u16, count x u32, packed length u32, packed bytes
// Indices past a palette's end resolve to height 0 / white.
// Throws DecodeError(CorruptFormat) on truncation.
[[nodiscard]] BlockChunkData decode_block_chunk_data(std::span<const uint8_t> bytes);

}  // namespace regionmap::world
