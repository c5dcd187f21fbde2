// regionmap Rendering
// compositor.cpp - Block display color resolution and fluid overlay

#include <algorithm>
#include <mutex>
#include <regionmap/core/logger.hpp>
#include <regionmap/rendering/compositor.hpp>
#include <regionmap/world/section_palette.hpp>
#include <string>
#include <unordered_set>

namespace regionmap::rendering {

namespace {

struct KeywordColor {
    std::string_view first;
    std::string_view second;
    Rgb color;
};

// Checked in order; either keyword matching anywhere in the name selects the color
constexpr KeywordColor KEYWORD_COLORS[] = {
    {"Grass", "Plant", {80, 180, 60}},   {"Leaves", "Leaves", {34, 139, 34}},
    {"Stone", "Rock", {120, 120, 120}},  {"Wood", "Trunk", {139, 90, 43}},
    {"Soil", "Dirt", {139, 90, 43}},     {"Sand", "Sand", {238, 214, 175}},
    {"Water", "Water", {63, 118, 228}},
};

uint8_t clamp_channel(float value) {
    return static_cast<uint8_t>(std::clamp(value, 0.0f, 255.0f));
}

BaseColor from_properties(const BlockDisplayProperties& props, ColorSource source) {
    BaseColor base;
    base.source = source;

    if (!props.tint_colors.empty()) {
        base.rgb = props.tint_colors.front();
        base.biome_tint_percent = props.biome_tint_percent;
        base.particle_color = props.particle_color;
    } else if (props.particle_color) {
        base.rgb = *props.particle_color;
    } else {
        base.rgb = DEFAULT_BLOCK_COLOR;
    }
    return base;
}

}  // namespace

struct Compositor::Impl {
    // Names already reported as unknown
    mutable std::mutex mutex;
    mutable std::unordered_set<std::string> reported;

    void report_unknown(std::string_view name) const {
        std::lock_guard<std::mutex> lock(mutex);
        if (reported.emplace(name).second) {
            REGIONMAP_LOG_DEBUG(core::log_category::RENDER, "No display properties for '{}', using fallback", name);
        }
    }
};

Compositor::Compositor(const BlockPropertyTable& properties)
    : properties_(properties), impl_(std::make_unique<Impl>()) {}

Compositor::~Compositor() = default;

std::optional<Rgb> Compositor::heuristic_color(std::string_view block_name) {
    for (const auto& keyword : KEYWORD_COLORS) {
        if (block_name.find(keyword.first) != std::string_view::npos ||
            block_name.find(keyword.second) != std::string_view::npos) {
            return keyword.color;
        }
    }
    return std::nullopt;
}

BaseColor Compositor::resolve_base_color(std::string_view block_name) const {
    if (block_name == world::EMPTY_NAME) {
        return BaseColor{RGB_BLACK, ColorSource::Heuristic, std::nullopt, std::nullopt};
    }

    if (const auto* props = properties_.find_exact(block_name)) {
        return from_properties(*props, ColorSource::ExactMatch);
    }

    if (const auto* entry = properties_.find_prefix(block_name)) {
        return from_properties(entry->second, ColorSource::PrefixMatch);
    }

    impl_->report_unknown(block_name);

    if (auto color = heuristic_color(block_name)) {
        return BaseColor{*color, ColorSource::Heuristic, std::nullopt, std::nullopt};
    }
    return BaseColor{DEFAULT_BLOCK_COLOR, ColorSource::Default, std::nullopt, std::nullopt};
}

Rgb Compositor::column_color(std::string_view block_name, const std::optional<Rgb>& biome_tint) const {
    BaseColor base = resolve_base_color(block_name);
    Rgb color = base.rgb;

    bool tinted = false;
    if (base.biome_tint_percent && *base.biome_tint_percent > 0 && biome_tint) {
        color = apply_biome_tint(color, *biome_tint, *base.biome_tint_percent);
        tinted = true;
    }

    if (base.particle_color && (!tinted || *base.biome_tint_percent < 100)) {
        color = apply_particle_multiply(color, *base.particle_color);
    }

    return color;
}

Rgb Compositor::apply_biome_tint(const Rgb& base, const Rgb& biome_tint, int percent) {
    const float p = static_cast<float>(std::clamp(percent, 0, 100)) / 100.0f;
    auto blend = [p](uint8_t b, uint8_t t) {
        return clamp_channel(static_cast<float>(b) * (1.0f - p) + static_cast<float>(t) * p);
    };
    return Rgb{blend(base.r, biome_tint.r), blend(base.g, biome_tint.g), blend(base.b, biome_tint.b)};
}

Rgb Compositor::apply_particle_multiply(const Rgb& color, const Rgb& particle) {
    auto multiply = [](uint8_t c, uint8_t m) { return static_cast<uint8_t>(static_cast<int>(c) * m / 255); };
    return Rgb{multiply(color.r, particle.r), multiply(color.g, particle.g), multiply(color.b, particle.b)};
}

std::optional<Rgb> Compositor::fluid_color(std::string_view fluid_type) {
    if (fluid_type.find("Water") != std::string_view::npos) {
        return WATER_COLOR;
    }
    if (fluid_type.find("Lava") != std::string_view::npos) {
        return LAVA_COLOR;
    }
    return std::nullopt;
}

Rgb Compositor::blend_fluid(const Rgb& terrain, const std::optional<std::string>& fluid_type, int fluid_depth) {
    if (!fluid_type || fluid_depth == 0) {
        return terrain;
    }

    auto fluid = fluid_color(*fluid_type);
    if (!fluid) {
        return terrain;
    }

    const float depth_factor = std::min(1.0f, 1.0f / static_cast<float>(std::max(1, fluid_depth)));
    auto blend = [depth_factor](uint8_t t, uint8_t f) {
        const float fc = static_cast<float>(f);
        return clamp_channel(fc + (static_cast<float>(t) - fc) * depth_factor);
    };
    return Rgb{blend(terrain.r, fluid->r), blend(terrain.g, fluid->g), blend(terrain.b, fluid->b)};
}

}  // namespace regionmap::rendering
