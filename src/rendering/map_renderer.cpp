// regionmap Rendering
// map_renderer.cpp - Top-down chunk and multi-chunk map rendering

#include <algorithm>
#include <future>
#include <optional>
#include <regionmap/core/logger.hpp>
#include <regionmap/rendering/map_renderer.hpp>
#include <regionmap/rendering/terrain_shading.hpp>
#include <regionmap/world/block_chunk_data.hpp>
#include <regionmap/world/decode_error.hpp>
#include <regionmap/world/surface_extractor.hpp>
#include <vector>

namespace regionmap::rendering {

namespace {

using world::CHUNK_SIZE;

// Neighbor heights with out-of-chunk cells replaced by the center height
NeighborHeights gather_neighbors(const world::ChunkSurface& surface, int32_t x, int32_t z) {
    const float center = static_cast<float>(surface.at(x, z).height);
    auto height = [&](int32_t dx, int32_t dz) {
        const int32_t nx = x + dx;
        const int32_t nz = z + dz;
        if (nx < 0 || nx >= CHUNK_SIZE || nz < 0 || nz >= CHUNK_SIZE) {
            return center;
        }
        return static_cast<float>(surface.at(nx, nz).height);
    };

    NeighborHeights n;
    n.n = height(0, -1);
    n.s = height(0, 1);
    n.w = height(-1, 0);
    n.e = height(1, 0);
    n.nw = height(-1, -1);
    n.ne = height(1, -1);
    n.sw = height(-1, 1);
    n.se = height(1, 1);
    return n;
}

std::optional<world::BlockChunkData> decode_tints(const world::ChunkDocument& document) {
    if (!document.block_chunk) {
        return std::nullopt;
    }
    try {
        return world::decode_block_chunk_data(*document.block_chunk);
    } catch (const world::DecodeError& e) {
        REGIONMAP_LOG_WARN(core::log_category::RENDER, "Ignoring biome tints: {}", e.what());
        return std::nullopt;
    }
}

struct ChunkResult {
    std::optional<RgbImage> image;
    std::optional<world::DecodeErrorCode> error;
};

}  // namespace

std::optional<RenderOptions> load_render_options(const core::Config& config) {
    const int scale = config.get_int(core::config_section::RENDER, core::config_key::PIXELS_PER_BLOCK, 1);
    const int threads = config.get_int(core::config_section::RENDER, core::config_key::THREADS, 1);

    if (scale < 1) {
        REGIONMAP_LOG_ERROR(core::log_category::CONFIG, "render.{} must be at least 1, got {}",
                            core::config_key::PIXELS_PER_BLOCK, scale);
        return std::nullopt;
    }
    if (threads < 1) {
        REGIONMAP_LOG_ERROR(core::log_category::CONFIG, "render.{} must be at least 1, got {}",
                            core::config_key::THREADS, threads);
        return std::nullopt;
    }

    RenderOptions options;
    options.pixels_per_block = static_cast<uint32_t>(scale);
    options.threads = static_cast<uint32_t>(threads);
    return options;
}

MapRenderer::MapRenderer(const Compositor& compositor, const RenderOptions& options)
    : compositor_(compositor), options_(options) {
    options_.pixels_per_block = std::max<uint32_t>(1, options_.pixels_per_block);
    options_.threads = std::max<uint32_t>(1, options_.threads);
}

RgbImage MapRenderer::render_chunk(const world::ChunkDocument& document) const {
    world::SurfaceExtractor extractor(document);
    const world::ChunkSurface surface = extractor.extract();
    const auto block_chunk = decode_tints(document);

    const uint32_t scale = options_.pixels_per_block;
    RgbImage image(chunk_pixel_size(), chunk_pixel_size());

    for (int32_t z = 0; z < CHUNK_SIZE; ++z) {
        for (int32_t x = 0; x < CHUNK_SIZE; ++x) {
            const world::ColumnSurface& column = surface.at(x, z);

            std::optional<Rgb> biome_tint;
            if (block_chunk) {
                const world::TintColor tint = block_chunk->tint_at(x, z);
                biome_tint = Rgb{tint.r, tint.g, tint.b};
            }

            const Rgb base = compositor_.column_color(column.block_name, biome_tint);
            const NeighborHeights neighbors = gather_neighbors(surface, x, z);
            const float center = static_cast<float>(column.height);

            for (uint32_t j = 0; j < scale; ++j) {
                for (uint32_t i = 0; i < scale; ++i) {
                    const float u = (static_cast<float>(i) + 0.5f) / static_cast<float>(scale);
                    const float v = (static_cast<float>(j) + 0.5f) / static_cast<float>(scale);

                    const float shade = TerrainShading::shade(center, neighbors, u, v);
                    Rgb color = TerrainShading::apply(base, shade);
                    color = Compositor::blend_fluid(color, column.fluid_type, column.fluid_depth);

                    image.set(static_cast<uint32_t>(x) * scale + i, static_cast<uint32_t>(z) * scale + j, color);
                }
            }
        }
    }

    return image;
}

RgbImage MapRenderer::render_map(const world::RegionReader& reader, const world::ChunkPos& start,
                                 const world::ChunkPos& end, RenderStats* stats) const {
    const world::ChunkPos lo(std::min(start.x, end.x), std::min(start.y, end.y));
    const world::ChunkPos hi(std::max(start.x, end.x), std::max(start.y, end.y));
    const uint32_t chunks_wide = static_cast<uint32_t>(hi.x - lo.x + 1);
    const uint32_t chunks_high = static_cast<uint32_t>(hi.y - lo.y + 1);

    REGIONMAP_LOG_INFO(core::log_category::RENDER, "Rendering {}x{} chunks ({} total) from ({}, {}) to ({}, {})",
                       chunks_wide, chunks_high, chunks_wide * chunks_high, lo.x, lo.y, hi.x, hi.y);

    RgbImage map(chunks_wide * chunk_pixel_size(), chunks_high * chunk_pixel_size());
    RenderStats local_stats;

    auto render_one = [this, &reader](world::ChunkPos pos) {
        ChunkResult result;
        try {
            world::ChunkDocument document = reader.read_chunk(pos);
            result.image = render_chunk(document);
        } catch (const world::DecodeError& e) {
            result.error = e.code();
            if (e.code() == world::DecodeErrorCode::NotFound) {
                REGIONMAP_LOG_DEBUG(core::log_category::RENDER, "Chunk ({}, {}) skipped: {}", pos.x, pos.y,
                                    e.what());
            } else {
                REGIONMAP_LOG_WARN(core::log_category::RENDER, "Chunk ({}, {}) failed [{}]: {}", pos.x, pos.y,
                                   world::decode_error_code_to_string(e.code()), e.what());
            }
        }
        return result;
    };

    auto place = [&](world::ChunkPos pos, ChunkResult&& result) {
        if (result.image) {
            map.blit(*result.image, static_cast<uint32_t>(pos.x - lo.x) * chunk_pixel_size(),
                     static_cast<uint32_t>(pos.y - lo.y) * chunk_pixel_size());
            ++local_stats.rendered;
        } else if (result.error == world::DecodeErrorCode::NotFound) {
            ++local_stats.missing;
        } else {
            ++local_stats.failed;
        }
    };

    std::vector<world::ChunkPos> positions;
    positions.reserve(static_cast<size_t>(chunks_wide) * chunks_high);
    for (int32_t z = lo.y; z <= hi.y; ++z) {
        for (int32_t x = lo.x; x <= hi.x; ++x) {
            positions.emplace_back(x, z);
        }
    }

    if (options_.threads <= 1) {
        for (const auto& pos : positions) {
            place(pos, render_one(pos));
        }
    } else {
        // Bounded batches of async workers; placement order does not affect pixels
        for (size_t begin = 0; begin < positions.size(); begin += options_.threads) {
            const size_t batch_end = std::min(positions.size(), begin + options_.threads);
            std::vector<std::future<ChunkResult>> futures;
            futures.reserve(batch_end - begin);
            for (size_t i = begin; i < batch_end; ++i) {
                futures.push_back(std::async(std::launch::async, render_one, positions[i]));
            }
            for (size_t i = begin; i < batch_end; ++i) {
                place(positions[i], futures[i - begin].get());
            }
        }
    }

    REGIONMAP_LOG_INFO(core::log_category::RENDER, "Rendered {} chunks ({} missing, {} failed)",
                       local_stats.rendered, local_stats.missing, local_stats.failed);
    if (stats) {
        *stats = local_stats;
    }
    return map;
}

}  // namespace regionmap::rendering
