// regionmap Rendering
// block_properties.hpp - Static per-block display properties

#pragma once

#include "color.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace regionmap::rendering {

struct BlockDisplayProperties {
    std::vector<Rgb> tint_colors;  // First entry is the base color
    int biome_tint_percent = 0;    // 0..100
    std::optional<Rgb> particle_color;
};

// Immutable name-keyed table. Iteration order is the order entries were
// supplied (file order when loaded from JSON).
class BlockPropertyTable {
public:
    using Entry = std::pair<std::string, BlockDisplayProperties>;

    BlockPropertyTable() = default;
    explicit BlockPropertyTable(std::vector<Entry> entries);

    // Load {"Name": {"TintUp": [...], "BiomeTintUp": n, "ParticleColor": "#..."}}.
    // Returns nullopt (and logs) if the file is unreadable or not a JSON object.
    [[nodiscard]] static std::optional<BlockPropertyTable> load(const std::filesystem::path& path);
    [[nodiscard]] static std::optional<BlockPropertyTable> parse(std::string_view json_text);

    [[nodiscard]] const BlockDisplayProperties* find_exact(std::string_view name) const;

    // First entry, in table order, whose name is a prefix of `name`
    [[nodiscard]] const Entry* find_prefix(std::string_view name) const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> by_name_;
};

}  // namespace regionmap::rendering
