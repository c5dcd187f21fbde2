// regionmap Rendering
// map_renderer.hpp - Top-down chunk and multi-chunk map rendering

#pragma once

#include "compositor.hpp"
#include "image_writer.hpp"

#include <regionmap/core/config.hpp>
#include <regionmap/world/chunk_document.hpp>
#include <regionmap/world/region_file.hpp>
#include <regionmap/world/types.hpp>

#include <cstdint>
#include <optional>

namespace regionmap::rendering {

struct RenderOptions {
    uint32_t pixels_per_block = 1;
    uint32_t threads = 1;  // Chunks rendered concurrently in render_map
};

// Reads the [render] section. Values below 1 are rejected (nullopt, error logged).
[[nodiscard]] std::optional<RenderOptions> load_render_options(const core::Config& config);

struct RenderStats {
    size_t rendered = 0;
    size_t missing = 0;  // NotFound
    size_t failed = 0;   // CorruptFormat / CorruptPayload

    [[nodiscard]] size_t total() const { return rendered + missing + failed; }
};

class MapRenderer {
public:
    MapRenderer(const Compositor& compositor, const RenderOptions& options = {});
    ~MapRenderer() = default;

    // Non-copyable
    MapRenderer(const MapRenderer&) = delete;
    MapRenderer& operator=(const MapRenderer&) = delete;

    // Square image, 32 * pixels_per_block wide.
    // Throws world::DecodeError if a block section is corrupt.
    [[nodiscard]] RgbImage render_chunk(const world::ChunkDocument& document) const;

    // Chunks from `start` to `end` inclusive, tiled in chunk-grid order.
    // Chunks that fail to load or decode are skipped and stay black.
    [[nodiscard]] RgbImage render_map(const world::RegionReader& reader, const world::ChunkPos& start,
                                      const world::ChunkPos& end, RenderStats* stats = nullptr) const;

    [[nodiscard]] uint32_t chunk_pixel_size() const { return world::CHUNK_SIZE * options_.pixels_per_block; }
    [[nodiscard]] const RenderOptions& options() const { return options_; }

private:
    const Compositor& compositor_;
    RenderOptions options_;
};

}  // namespace regionmap::rendering
