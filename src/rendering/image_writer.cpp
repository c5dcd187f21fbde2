// regionmap Rendering
// image_writer.cpp - PNG output using system libpng

#include <png.h>

#include <cstdio>
#include <regionmap/core/logger.hpp>
#include <regionmap/platform/file_io.hpp>
#include <regionmap/rendering/image_writer.hpp>

namespace regionmap::rendering {

void RgbImage::blit(const RgbImage& source, uint32_t x, uint32_t y) {
    for (uint32_t sy = 0; sy < source.height() && y + sy < height_; ++sy) {
        for (uint32_t sx = 0; sx < source.width() && x + sx < width_; ++sx) {
            set(x + sx, y + sy, source.get(sx, sy));
        }
    }
}

namespace {

void png_write_fn(png_structp png_ptr, png_bytep data, png_size_t length) {
    FILE* fp = static_cast<FILE*>(png_get_io_ptr(png_ptr));
    if (fwrite(data, 1, length, fp) != length) {
        png_error(png_ptr, "write error");
    }
}

void png_flush_fn(png_structp png_ptr) {
    FILE* fp = static_cast<FILE*>(png_get_io_ptr(png_ptr));
    fflush(fp);
}

}  // namespace

bool write_png(const std::filesystem::path& path, const RgbImage& image) {
    if (image.empty()) {
        REGIONMAP_LOG_ERROR(core::log_category::RENDER, "Refusing to write empty image to {}", path.string());
        return false;
    }

    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent) &&
        !platform::FileSystem::create_directories(parent)) {
        REGIONMAP_LOG_ERROR(core::log_category::RENDER, "Cannot create output directory {}", parent.string());
        return false;
    }

    FILE* fp = fopen(path.string().c_str(), "wb");
    if (!fp) {
        REGIONMAP_LOG_ERROR(core::log_category::RENDER, "Cannot open {} for writing", path.string());
        return false;
    }

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) {
        fclose(fp);
        REGIONMAP_LOG_ERROR(core::log_category::RENDER, "png_create_write_struct failed");
        return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        fclose(fp);
        REGIONMAP_LOG_ERROR(core::log_category::RENDER, "png_create_info_struct failed");
        return false;
    }

    std::vector<png_bytep> rows(image.height());
    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        fclose(fp);
        REGIONMAP_LOG_ERROR(core::log_category::RENDER, "libpng error while writing {}", path.string());
        return false;
    }

    png_set_write_fn(png_ptr, fp, png_write_fn, png_flush_fn);
    png_set_IHDR(png_ptr, info_ptr, image.width(), image.height(), 8, PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr, info_ptr);

    const size_t stride = static_cast<size_t>(image.width()) * 3;
    auto* base = const_cast<png_bytep>(image.data().data());
    for (uint32_t y = 0; y < image.height(); ++y) {
        rows[y] = base + y * stride;
    }
    png_write_image(png_ptr, rows.data());
    png_write_end(png_ptr, nullptr);

    png_destroy_write_struct(&png_ptr, &info_ptr);
    if (fclose(fp) != 0) {
        REGIONMAP_LOG_ERROR(core::log_category::RENDER, "Failed to close {}", path.string());
        return false;
    }

    REGIONMAP_LOG_INFO(core::log_category::RENDER, "Wrote {}x{} image to {}", image.width(), image.height(),
                       path.string());
    return true;
}

}  // namespace regionmap::rendering
