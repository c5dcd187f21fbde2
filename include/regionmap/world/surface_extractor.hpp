// regionmap World Format
// surface_extractor.hpp - Topmost solid block and fluid column per (x, z)

#pragma once

#include "chunk_document.hpp"
#include "section_palette.hpp"
#include "types.hpp"

#include <array>
#include <optional>
#include <string>

namespace regionmap::world {

struct SurfaceHit {
    int32_t world_y = 0;
    std::string block_name{EMPTY_NAME};
    int32_t section_index = 0;

    bool operator==(const SurfaceHit&) const = default;
};

struct FluidSurface {
    std::optional<std::string> fluid_type;
    int32_t depth = 0;  // Topmost fluid Y minus surface Y

    bool operator==(const FluidSurface&) const = default;
};

struct ColumnSurface {
    int32_t height = 0;
    std::string block_name{EMPTY_NAME};
    std::optional<std::string> fluid_type;
    int32_t fluid_depth = 0;
};

// Per-column surface for a whole chunk, indexed [z][x]
struct ChunkSurface {
    std::array<ColumnSurface, COLUMNS_PER_CHUNK> columns;

    [[nodiscard]] const ColumnSurface& at(int32_t x, int32_t z) const {
        return columns[static_cast<size_t>(x + z * CHUNK_SIZE)];
    }
    [[nodiscard]] ColumnSurface& at(int32_t x, int32_t z) { return columns[static_cast<size_t>(x + z * CHUNK_SIZE)]; }
};

// Walks a chunk's sections top-down. Each section blob is decoded at most once
// per extractor, on first use. The document must outlive the extractor.
class SurfaceExtractor {
public:
    explicit SurfaceExtractor(const ChunkDocument& document);
    ~SurfaceExtractor();

    // Non-copyable
    SurfaceExtractor(const SurfaceExtractor&) = delete;
    SurfaceExtractor& operator=(const SurfaceExtractor&) = delete;

    // Topmost cell that is neither "Empty" nor a "*"-prefixed marker.
    // Returns (0, "Empty", 0) for a column with no solid cell.
    // Throws DecodeError(CorruptFormat) for a corrupt block section.
    [[nodiscard]] SurfaceHit find_surface_height(int32_t x, int32_t z);

    // Topmost contiguous fluid run strictly above `surface_y`
    [[nodiscard]] FluidSurface find_surface_fluid(int32_t x, int32_t z, int32_t surface_y);

    // Both queries for all 32x32 columns
    [[nodiscard]] ChunkSurface extract();

private:
    const BlockSection* block_section(int32_t index);
    const FluidSection* fluid_section(int32_t index);

    const ChunkDocument& document_;
    std::array<std::optional<BlockSection>, SECTIONS_PER_CHUNK> blocks_;
    std::array<std::optional<FluidSection>, SECTIONS_PER_CHUNK> fluids_;
};

}  // namespace regionmap::world
