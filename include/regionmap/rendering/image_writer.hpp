// regionmap Rendering
// image_writer.hpp - RGB raster and PNG output

#pragma once

#include "color.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace regionmap::rendering {

// Row-major 8-bit RGB raster, initialized to black
class RgbImage {
public:
    RgbImage() = default;
    RgbImage(uint32_t width, uint32_t height) : width_(width), height_(height), pixels_(size_t(width) * height * 3) {}

    [[nodiscard]] uint32_t width() const { return width_; }
    [[nodiscard]] uint32_t height() const { return height_; }
    [[nodiscard]] bool empty() const { return pixels_.empty(); }

    [[nodiscard]] Rgb get(uint32_t x, uint32_t y) const {
        const size_t i = offset(x, y);
        return Rgb{pixels_[i], pixels_[i + 1], pixels_[i + 2]};
    }

    void set(uint32_t x, uint32_t y, const Rgb& color) {
        const size_t i = offset(x, y);
        pixels_[i] = color.r;
        pixels_[i + 1] = color.g;
        pixels_[i + 2] = color.b;
    }

    // Copy `source` with its top-left corner at (x, y); clipped to bounds
    void blit(const RgbImage& source, uint32_t x, uint32_t y);

    [[nodiscard]] const std::vector<uint8_t>& data() const { return pixels_; }

private:
    [[nodiscard]] size_t offset(uint32_t x, uint32_t y) const { return (size_t(y) * width_ + x) * 3; }

    uint32_t width_ = 0;
    uint32_t height_ = 0;
    std::vector<uint8_t> pixels_;
};

// Write an 8-bit RGB PNG with libpng. Logs and returns false on failure.
bool write_png(const std::filesystem::path& path, const RgbImage& image);

}  // namespace regionmap::rendering
