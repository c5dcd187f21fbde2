// regionmap Rendering
// compositor.hpp - Block display color resolution and fluid overlay

#pragma once

#include "block_properties.hpp"
#include "color.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace regionmap::rendering {

inline constexpr Rgb WATER_COLOR{25, 131, 217};
inline constexpr Rgb LAVA_COLOR{249, 78, 17};
inline constexpr Rgb DEFAULT_BLOCK_COLOR{128, 128, 128};

enum class ColorSource : uint8_t {
    ExactMatch,   // Table entry with the same name
    PrefixMatch,  // Table entry whose name prefixes the block name
    Heuristic,    // Keyword fallback table
    Default       // Nothing matched
};

struct BaseColor {
    Rgb rgb;
    ColorSource source = ColorSource::Default;
    std::optional<int> biome_tint_percent;  // Set when rgb came from TintUp
    std::optional<Rgb> particle_color;      // Only when distinct from rgb's source
};

// Resolves final block colors against an immutable property table.
// The table must outlive the compositor. Safe to share between threads.
class Compositor {
public:
    explicit Compositor(const BlockPropertyTable& properties);
    ~Compositor();

    // Non-copyable
    Compositor(const Compositor&) = delete;
    Compositor& operator=(const Compositor&) = delete;

    // Exact match, then prefix match, then keyword heuristics, then gray
    [[nodiscard]] BaseColor resolve_base_color(std::string_view block_name) const;

    // Base color with biome tint and particle modulation applied
    [[nodiscard]] Rgb column_color(std::string_view block_name, const std::optional<Rgb>& biome_tint) const;

    [[nodiscard]] const BlockPropertyTable& properties() const { return properties_; }

    // base * (1 - p) + tint * p, with p = percent / 100
    [[nodiscard]] static Rgb apply_biome_tint(const Rgb& base, const Rgb& biome_tint, int percent);

    // Per channel color * particle / 255
    [[nodiscard]] static Rgb apply_particle_multiply(const Rgb& color, const Rgb& particle);

    // Deeper fluid approaches the pure fluid color; depth 1 keeps the terrain
    [[nodiscard]] static Rgb blend_fluid(const Rgb& terrain, const std::optional<std::string>& fluid_type,
                                         int fluid_depth);

    [[nodiscard]] static std::optional<Rgb> fluid_color(std::string_view fluid_type);
    [[nodiscard]] static std::optional<Rgb> heuristic_color(std::string_view block_name);

private:
    struct Impl;
    const BlockPropertyTable& properties_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace regionmap::rendering
