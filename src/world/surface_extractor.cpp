// regionmap World Format
// surface_extractor.cpp - Topmost solid block and fluid column per (x, z)

#include <regionmap/world/surface_extractor.hpp>

namespace regionmap::world {

namespace {

bool is_solid(std::string_view name) {
    return name != EMPTY_NAME && !name.starts_with('*');
}

}  // namespace

SurfaceExtractor::SurfaceExtractor(const ChunkDocument& document) : document_(document) {}

SurfaceExtractor::~SurfaceExtractor() = default;

const BlockSection* SurfaceExtractor::block_section(int32_t index) {
    const auto& component = document_.sections[static_cast<size_t>(index)].block;
    if (!component) {
        return nullptr;
    }

    auto& cached = blocks_[static_cast<size_t>(index)];
    if (!cached) {
        cached = decode_block_section(component->data);
    }
    return &*cached;
}

const FluidSection* SurfaceExtractor::fluid_section(int32_t index) {
    const auto& component = document_.sections[static_cast<size_t>(index)].fluid;
    if (!component) {
        return nullptr;
    }

    auto& cached = fluids_[static_cast<size_t>(index)];
    if (!cached) {
        cached = decode_fluid_section(component->data);
    }
    return &*cached;
}

SurfaceHit SurfaceExtractor::find_surface_height(int32_t x, int32_t z) {
    for (int32_t section_index = SECTIONS_PER_CHUNK - 1; section_index >= 0; --section_index) {
        const BlockSection* section = block_section(section_index);
        if (section == nullptr || !section->has_indices()) {
            continue;
        }

        for (int32_t local_y = SECTION_HEIGHT - 1; local_y >= 0; --local_y) {
            std::string_view name = section->block_at(x, local_y, z);
            if (!is_solid(name)) {
                continue;
            }
            return {section_index * SECTION_HEIGHT + local_y, std::string(name), section_index};
        }
    }

    return {};
}

FluidSurface SurfaceExtractor::find_surface_fluid(int32_t x, int32_t z, int32_t surface_y) {
    std::optional<std::string_view> run_type;
    int32_t run_top = 0;

    for (int32_t world_y = WORLD_HEIGHT - 1; world_y > surface_y; --world_y) {
        const FluidSection* section = fluid_section(world_y / SECTION_HEIGHT);
        if (section == nullptr || !section->has_data()) {
            continue;
        }

        FluidCell cell = section->fluid_at(x, world_y % SECTION_HEIGHT, z);
        if (cell.is_present()) {
            if (!run_type) {
                run_type = cell.name;
                run_top = world_y;
            } else if (cell.name != *run_type) {
                break;
            }
        } else if (run_type) {
            break;
        }
    }

    if (!run_type) {
        return {};
    }
    return {std::string(*run_type), run_top - surface_y};
}

ChunkSurface SurfaceExtractor::extract() {
    ChunkSurface surface;

    for (int32_t z = 0; z < CHUNK_SIZE; ++z) {
        for (int32_t x = 0; x < CHUNK_SIZE; ++x) {
            SurfaceHit hit = find_surface_height(x, z);
            FluidSurface fluid = find_surface_fluid(x, z, hit.world_y);

            ColumnSurface& column = surface.at(x, z);
            column.height = hit.world_y;
            column.block_name = std::move(hit.block_name);
            column.fluid_type = std::move(fluid.fluid_type);
            column.fluid_depth = fluid.depth;
        }
    }

    return surface;
}

}  // namespace regionmap::world
