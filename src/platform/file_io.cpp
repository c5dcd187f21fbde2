// regionmap Platform Layer
// file_io.cpp - File system helpers

#include <regionmap/platform/file_io.hpp>

#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>

namespace regionmap::platform {

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path() / "regionmap";
}

std::optional<std::vector<uint8_t>> FileSystem::read_binary(const fs::path& path) {
    try {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        auto size = file.tellg();
        if (size < 0) {
            return std::nullopt;
        }

        std::vector<uint8_t> data(static_cast<size_t>(size));
        file.seekg(0, std::ios::beg);
        file.read(reinterpret_cast<char*>(data.data()), size);

        if (!file) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return data;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        if (!file && !file.eof()) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return content;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool FileSystem::write_binary(const fs::path& path, std::span<const uint8_t> data) {
    try {
        if (path.has_parent_path()) {
            create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for writing: {}", path.string());
            return false;
        }

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));

        if (!file) {
            spdlog::warn("Error writing file: {}", path.string());
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    try {
        if (path.has_parent_path()) {
            create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for writing: {}", path.string());
            return false;
        }

        file << content;

        if (!file) {
            spdlog::warn("Error writing file: {}", path.string());
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::create_directories(const fs::path& path) {
    try {
        fs::create_directories(path);
        return fs::is_directory(path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create directories '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::exists(const fs::path& path) {
    try {
        return fs::exists(path);
    } catch (const std::exception& e) {
        spdlog::warn("Error checking existence of '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::is_file(const fs::path& path) {
    try {
        return fs::is_regular_file(path);
    } catch (const std::exception& e) {
        spdlog::warn("Error checking if '{}' is file: {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::remove_all(const fs::path& path) {
    try {
        fs::remove_all(path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove all '{}': {}", path.string(), e.what());
        return false;
    }
}

std::optional<size_t> FileSystem::file_size(const fs::path& path) {
    try {
        if (!fs::exists(path) || !fs::is_regular_file(path)) {
            return std::nullopt;
        }
        return static_cast<size_t>(fs::file_size(path));
    } catch (const std::exception& e) {
        spdlog::warn("Error getting size of '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

}  // namespace regionmap::platform
