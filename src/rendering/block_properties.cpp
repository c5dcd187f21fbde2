// regionmap Rendering
// block_properties.cpp - JSON loading of per-block display properties

#include <nlohmann/json.hpp>

#include <algorithm>
#include <regionmap/core/logger.hpp>
#include <regionmap/platform/file_io.hpp>
#include <regionmap/rendering/block_properties.hpp>

namespace regionmap::rendering {

using json = nlohmann::ordered_json;

namespace {

BlockDisplayProperties parse_entry(const std::string& name, const json& value) {
    BlockDisplayProperties props;

    auto tint = value.find("TintUp");
    if (tint != value.end() && tint->is_array()) {
        for (const auto& color : *tint) {
            if (!color.is_string()) {
                continue;
            }
            if (auto rgb = parse_hex_color(color.get<std::string>())) {
                props.tint_colors.push_back(*rgb);
            } else {
                REGIONMAP_LOG_WARN(core::log_category::ASSETS, "{}: ignoring malformed tint color '{}'", name,
                                   color.get<std::string>());
            }
        }
    }

    auto percent = value.find("BiomeTintUp");
    if (percent != value.end() && percent->is_number()) {
        props.biome_tint_percent = std::clamp(percent->get<int>(), 0, 100);
    }

    auto particle = value.find("ParticleColor");
    if (particle != value.end() && particle->is_string()) {
        props.particle_color = parse_hex_color(particle->get<std::string>());
        if (!props.particle_color) {
            REGIONMAP_LOG_WARN(core::log_category::ASSETS, "{}: ignoring malformed particle color '{}'", name,
                               particle->get<std::string>());
        }
    }

    return props;
}

}  // namespace

BlockPropertyTable::BlockPropertyTable(std::vector<Entry> entries) : entries_(std::move(entries)) {
    by_name_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        by_name_.emplace(entries_[i].first, i);
    }
}

std::optional<BlockPropertyTable> BlockPropertyTable::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        REGIONMAP_LOG_ERROR(core::log_category::ASSETS, "Failed to read block properties: {}", path.string());
        return std::nullopt;
    }

    auto table = parse(*content);
    if (table) {
        REGIONMAP_LOG_INFO(core::log_category::ASSETS, "Loaded {} block properties from {}", table->size(),
                           path.string());
    }
    return table;
}

std::optional<BlockPropertyTable> BlockPropertyTable::parse(std::string_view json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        REGIONMAP_LOG_ERROR(core::log_category::ASSETS, "Failed to parse block properties: {}", e.what());
        return std::nullopt;
    }

    if (!root.is_object()) {
        REGIONMAP_LOG_ERROR(core::log_category::ASSETS, "Block properties root is not an object");
        return std::nullopt;
    }

    std::vector<Entry> entries;
    entries.reserve(root.size());
    for (const auto& [name, value] : root.items()) {
        if (!value.is_object()) {
            REGIONMAP_LOG_WARN(core::log_category::ASSETS, "Skipping block properties for {}: not an object", name);
            continue;
        }
        entries.emplace_back(name, parse_entry(name, value));
    }

    return BlockPropertyTable(std::move(entries));
}

const BlockDisplayProperties* BlockPropertyTable::find_exact(std::string_view name) const {
    auto it = by_name_.find(std::string(name));
    if (it == by_name_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

const BlockPropertyTable::Entry* BlockPropertyTable::find_prefix(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (!entry.first.empty() && name.starts_with(entry.first)) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace regionmap::rendering
