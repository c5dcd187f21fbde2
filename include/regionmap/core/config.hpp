// regionmap Core
// config.hpp - JSON-based configuration

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace regionmap::core {

// Configuration with JSON file persistence. Values loaded from a file are
// layered over the built-in defaults.
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Load/Save operations
    bool load(const std::filesystem::path& path);
    bool save(const std::filesystem::path& path) const;
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;

    // Typed getters with defaults (also returned on type mismatch)
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    // Setters
    void set_int(std::string_view section, std::string_view key, int value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;

    // Reset to built-in defaults
    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Pre-defined section names for consistency
namespace config_section {
    inline constexpr const char* PATHS = "paths";
    inline constexpr const char* RENDER = "render";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

// Pre-defined key names for consistency
namespace config_key {
    // Paths section
    inline constexpr const char* CHUNKS_DIRECTORY = "chunks_directory";
    inline constexpr const char* BLOCK_PROPERTIES = "block_properties";

    // Render section
    inline constexpr const char* PIXELS_PER_BLOCK = "pixels_per_block";
    inline constexpr const char* THREADS = "threads";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
    inline constexpr const char* LOG_FILE = "log_file";
}  // namespace config_key

}  // namespace regionmap::core
