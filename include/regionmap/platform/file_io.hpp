// regionmap Platform Layer
// file_io.hpp - File system helpers

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace regionmap::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations. Failures are logged and
// reported through the return value; nothing here throws.
class FileSystem {
public:
    static fs::path get_temp_directory();

    // Synchronous file operations
    static std::optional<std::vector<uint8_t>> read_binary(const fs::path& path);
    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_binary(const fs::path& path, std::span<const uint8_t> data);
    static bool write_text(const fs::path& path, std::string_view content);

    // Directory operations
    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool is_file(const fs::path& path);
    static bool remove_all(const fs::path& path);

    static std::optional<size_t> file_size(const fs::path& path);

private:
    FileSystem() = delete;  // Static class, no instances
};

}  // namespace regionmap::platform
