// regionmap World Format
// types.hpp - Format constants, coordinates, and conversion functions

#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>

namespace regionmap::world {

// ============================================================================
// Chunk Constants
// ============================================================================

inline constexpr int32_t CHUNK_SIZE = 32;  // Blocks along X and Z
inline constexpr int32_t SECTION_HEIGHT = 32;
inline constexpr int32_t SECTIONS_PER_CHUNK = 10;
inline constexpr int32_t WORLD_HEIGHT = SECTION_HEIGHT * SECTIONS_PER_CHUNK;  // 320
inline constexpr int32_t SECTION_VOLUME = CHUNK_SIZE * SECTION_HEIGHT * CHUNK_SIZE;
inline constexpr int32_t COLUMNS_PER_CHUNK = CHUNK_SIZE * CHUNK_SIZE;

// Region file dimensions (32x32 chunks per region)
inline constexpr int32_t REGION_SIZE = 32;
inline constexpr int32_t CHUNKS_PER_REGION = REGION_SIZE * REGION_SIZE;

// ============================================================================
// Coordinate Types (using GLM)
// ============================================================================

// Chunk coordinate (chunk grid position, x and z only)
using ChunkPos = glm::ivec2;

// ============================================================================
// Coordinate Conversion Functions
// ============================================================================

// Convert chunk position to region position (floor division)
[[nodiscard]] inline glm::ivec2 chunk_to_region(const ChunkPos& chunk) {
    return glm::ivec2(chunk.x >= 0 ? chunk.x / REGION_SIZE : (chunk.x - REGION_SIZE + 1) / REGION_SIZE,
                      chunk.y >= 0 ? chunk.y / REGION_SIZE : (chunk.y - REGION_SIZE + 1) / REGION_SIZE);
}

// Get chunk's local position within its region
[[nodiscard]] inline glm::ivec2 chunk_local_in_region(const ChunkPos& chunk) {
    auto mod = [](int32_t a, int32_t b) -> int32_t {
        int32_t result = a % b;
        return result >= 0 ? result : result + b;
    };
    return glm::ivec2(mod(chunk.x, REGION_SIZE), mod(chunk.y, REGION_SIZE));
}

// Flat index into every packed section array: Y-major, then Z, then X
[[nodiscard]] constexpr size_t cell_index(int32_t x, int32_t y, int32_t z) {
    return (static_cast<size_t>(y & 31) << 10) | (static_cast<size_t>(z & 31) << 5) | static_cast<size_t>(x & 31);
}

}  // namespace regionmap::world
