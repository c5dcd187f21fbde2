// regionmap Rendering
// terrain_shading.cpp - Slope-based Lambert shading of the height field

#include <regionmap/rendering/terrain_shading.hpp>

#include <algorithm>
#include <cmath>

namespace regionmap::rendering {

glm::vec2 TerrainShading::gradient(float center, const NeighborHeights& h, float u, float v) {
    // Axis-aligned: backward slope at u=0, forward slope at u=1
    const float axis_x = glm::mix(center - h.w, h.e - center, u);
    const float axis_z = glm::mix(center - h.n, h.s - center, v);

    // Diagonals: NW->SE runs along (+x, +z), NE->SW along (-x, +z)
    const float ud = (u + v) * 0.5f;
    const float vd = (1.0f - u + v) * 0.5f;
    const float nw_se = glm::mix(center - h.nw, h.se - center, ud);
    const float ne_sw = glm::mix(center - h.ne, h.sw - center, vd);
    const float diag_x = (nw_se - ne_sw) * 0.5f;
    const float diag_z = (nw_se + ne_sw) * 0.5f;

    return glm::vec2(AXIS_WEIGHT * axis_x + DIAGONAL_WEIGHT * diag_x, AXIS_WEIGHT * axis_z + DIAGONAL_WEIGHT * diag_z);
}

float TerrainShading::shade(float center, const NeighborHeights& neighbors, float u, float v) {
    const glm::vec2 slope = gradient(center, neighbors, u, v);
    const glm::vec3 normal = glm::normalize(glm::vec3(slope.x, VERTICAL_SCALE, slope.y));

    const float lambert = std::max(0.0f, glm::dot(normal, light_direction()));
    return AMBIENT + DIFFUSE * lambert;
}

Rgb TerrainShading::apply(const Rgb& color, float multiplier) {
    auto channel = [multiplier](uint8_t c) {
        return static_cast<uint8_t>(std::min(255.0f, std::trunc(static_cast<float>(c) * multiplier)));
    };
    return Rgb{channel(color.r), channel(color.g), channel(color.b)};
}

}  // namespace regionmap::rendering
