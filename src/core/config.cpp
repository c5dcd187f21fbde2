// regionmap Core
// config.cpp - JSON-based configuration implementation

#include <nlohmann/json.hpp>

#include <regionmap/core/config.hpp>
#include <regionmap/core/logger.hpp>
#include <regionmap/platform/file_io.hpp>

namespace regionmap::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;

    // Value at section.key, or nullptr
    const json* find(std::string_view section, std::string_view key) const {
        auto s = data.find(std::string(section));
        if (s == data.end() || !s->is_object()) {
            return nullptr;
        }
        auto k = s->find(std::string(key));
        if (k == s->end()) {
            return nullptr;
        }
        return &*k;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        REGIONMAP_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    try {
        json loaded = json::parse(*content);
        if (!loaded.is_object()) {
            REGIONMAP_LOG_ERROR(log_category::CONFIG, "Config root is not an object: {}", path.string());
            return false;
        }
        set_defaults();
        impl_->data.merge_patch(loaded);
        impl_->path = path;
        REGIONMAP_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
        return true;
    } catch (const json::parse_error& e) {
        REGIONMAP_LOG_ERROR(log_category::CONFIG, "Failed to parse config file: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    // Pretty print with 4 spaces indent
    std::string content = impl_->data.dump(4);

    if (!platform::FileSystem::write_text(path, content)) {
        REGIONMAP_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    REGIONMAP_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (!save(path)) {
        REGIONMAP_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    const json* value = impl_->find(section, key);
    if (value && value->is_number_integer()) {
        return value->get<int>();
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    const json* value = impl_->find(section, key);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return std::string(default_value);
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->data[std::string(section)][std::string(key)] = value;
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->data[std::string(section)][std::string(key)] = std::string(value);
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::PATHS,
                        {{config_key::CHUNKS_DIRECTORY, "universe/worlds/default/chunks"},
                         {config_key::BLOCK_PROPERTIES, "block_properties.json"}}},
                       {config_section::RENDER, {{config_key::PIXELS_PER_BLOCK, 1}, {config_key::THREADS, 1}}},
                       {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}, {config_key::LOG_FILE, ""}}}};
}

}  // namespace regionmap::core
