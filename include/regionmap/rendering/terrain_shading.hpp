// regionmap Rendering
// terrain_shading.hpp - Slope-based Lambert shading of the height field

#pragma once

#include "color.hpp"

#include <glm/glm.hpp>

namespace regionmap::rendering {

// Heights of the eight cells around a column
struct NeighborHeights {
    float n = 0.0f;
    float s = 0.0f;
    float w = 0.0f;
    float e = 0.0f;
    float nw = 0.0f;
    float ne = 0.0f;
    float sw = 0.0f;
    float se = 0.0f;

    [[nodiscard]] static NeighborHeights flat(float height) {
        return {height, height, height, height, height, height, height, height};
    }
};

class TerrainShading {
public:
    static constexpr float AMBIENT = 0.4f;
    static constexpr float DIFFUSE = 0.6f;
    static constexpr float VERTICAL_SCALE = 3.0f;
    static constexpr float AXIS_WEIGHT = 2.0f;
    static constexpr float DIAGONAL_WEIGHT = 1.0f;

    // Normalized light direction, from top-left-front
    [[nodiscard]] static glm::vec3 light_direction() { return glm::normalize(glm::vec3(-0.2f, 0.8f, 0.5f)); }

    // Multiplier in [0.4, 1.0] for the sub-cell sample (u, v) in [0, 1]^2.
    // Axis-aligned and diagonal gradients are interpolated across the cell;
    // the axis estimate is weighted twice the diagonal one.
    [[nodiscard]] static float shade(float center, const NeighborHeights& neighbors, float u, float v);

    // Surface gradient (dh/dx, dh/dz) used by shade()
    [[nodiscard]] static glm::vec2 gradient(float center, const NeighborHeights& neighbors, float u, float v);

    // Per channel min(255, trunc(c * multiplier))
    [[nodiscard]] static Rgb apply(const Rgb& color, float multiplier);
};

}  // namespace regionmap::rendering
