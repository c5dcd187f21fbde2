// regionmap World Format Tests
// types_test.cpp - Tests for format constants and coordinate conversions

#include <gtest/gtest.h>

#include <regionmap/world/types.hpp>

#include <set>

namespace regionmap::world {
namespace {

// ============================================================================
// Constants
// ============================================================================

TEST(WorldTypesTest, DerivedConstants) {
    EXPECT_EQ(WORLD_HEIGHT, 320);
    EXPECT_EQ(SECTION_VOLUME, 32768);
    EXPECT_EQ(COLUMNS_PER_CHUNK, 1024);
    EXPECT_EQ(CHUNKS_PER_REGION, 1024);
}

// ============================================================================
// Cell Index Tests
// ============================================================================

TEST(WorldTypesTest, CellIndex_Layout) {
    EXPECT_EQ(cell_index(0, 0, 0), 0u);
    EXPECT_EQ(cell_index(1, 0, 0), 1u);
    EXPECT_EQ(cell_index(0, 0, 1), 32u);
    EXPECT_EQ(cell_index(0, 1, 0), 1024u);
    EXPECT_EQ(cell_index(31, 31, 31), 32767u);
}

TEST(WorldTypesTest, CellIndex_MasksToFiveBits) {
    // World Y maps to the local Y within its section
    EXPECT_EQ(cell_index(5, 52, 10), cell_index(5, 20, 10));
    EXPECT_EQ(cell_index(33, 0, 0), cell_index(1, 0, 0));
}

TEST(WorldTypesTest, CellIndex_IsBijection) {
    std::set<size_t> seen;
    for (int32_t y = 0; y < 32; ++y) {
        for (int32_t z = 0; z < 32; ++z) {
            for (int32_t x = 0; x < 32; ++x) {
                size_t index = cell_index(x, y, z);
                EXPECT_LT(index, static_cast<size_t>(SECTION_VOLUME));
                seen.insert(index);
            }
        }
    }
    EXPECT_EQ(seen.size(), static_cast<size_t>(SECTION_VOLUME));
}

// ============================================================================
// Region Coordinate Tests
// ============================================================================

TEST(WorldTypesTest, ChunkToRegion_PositiveCoords) {
    EXPECT_EQ(chunk_to_region(ChunkPos(0, 0)), glm::ivec2(0, 0));
    EXPECT_EQ(chunk_to_region(ChunkPos(31, 32)), glm::ivec2(0, 1));
    EXPECT_EQ(chunk_to_region(ChunkPos(64, 95)), glm::ivec2(2, 2));
}

TEST(WorldTypesTest, ChunkToRegion_NegativeCoords) {
    EXPECT_EQ(chunk_to_region(ChunkPos(-1, -1)), glm::ivec2(-1, -1));
    EXPECT_EQ(chunk_to_region(ChunkPos(-32, -33)), glm::ivec2(-1, -2));
}

TEST(WorldTypesTest, ChunkLocalInRegion) {
    EXPECT_EQ(chunk_local_in_region(ChunkPos(5, 40)), glm::ivec2(5, 8));
    EXPECT_EQ(chunk_local_in_region(ChunkPos(-1, -32)), glm::ivec2(31, 0));
    EXPECT_EQ(chunk_local_in_region(ChunkPos(-33, -2)), glm::ivec2(31, 30));
}

}  // namespace
}  // namespace regionmap::world
