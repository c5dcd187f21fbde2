// regionmap World Format
// region_file.cpp - Region container parsing and chunk lookup

#include <fstream>
#include <regionmap/core/logger.hpp>
#include <regionmap/world/byte_cursor.hpp>
#include <regionmap/world/decode_error.hpp>
#include <regionmap/world/region_file.hpp>

namespace regionmap::world {

// ============================================================================
// RegionFile Implementation
// ============================================================================

struct RegionFile::Impl {
    std::filesystem::path path;
    mutable std::ifstream file;
    bool is_open = false;
    uint64_t file_size = 0;
    RegionHeader header;

    // Segment index per chunk slot (32x32 = 1024 entries), 0 = absent
    std::array<uint32_t, TOTAL_CHUNKS> segments{};

    // Read exactly `count` bytes at `offset`
    std::vector<uint8_t> read_at(uint64_t offset, size_t count) const {
        if (offset > file_size || count > file_size - offset) {
            throw DecodeError(DecodeErrorCode::CorruptFormat,
                              fmt::format("{}: {} bytes at offset {} exceed file size {}", path.string(), count,
                                          offset, file_size),
                              static_cast<size_t>(offset), count);
        }
        std::vector<uint8_t> data(count);
        file.clear();
        file.seekg(static_cast<std::streamoff>(offset));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(count));
        const auto got = static_cast<size_t>(file.gcount());
        if (got != count) {
            throw DecodeError(DecodeErrorCode::CorruptFormat,
                              fmt::format("{}: expected {} bytes at offset {}, got {}", path.string(), count, offset,
                                          got),
                              static_cast<size_t>(offset), count);
        }
        return data;
    }
};

RegionFile::RegionFile(const std::filesystem::path& path) : impl_(std::make_unique<Impl>()) {
    impl_->path = path;
}

RegionFile::~RegionFile() {
    close();
}

void RegionFile::open() {
    if (impl_->is_open) {
        return;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(impl_->path, ec)) {
        throw DecodeError(DecodeErrorCode::NotFound, fmt::format("region file not found: {}", impl_->path.string()));
    }

    impl_->file_size = std::filesystem::file_size(impl_->path, ec);
    if (ec) {
        throw DecodeError(DecodeErrorCode::NotFound,
                          fmt::format("failed to stat region file {}: {}", impl_->path.string(), ec.message()));
    }

    impl_->file.open(impl_->path, std::ios::binary);
    if (!impl_->file) {
        throw DecodeError(DecodeErrorCode::NotFound,
                          fmt::format("failed to open region file: {}", impl_->path.string()));
    }

    try {
        std::vector<uint8_t> prefix = impl_->read_at(0, REGION_HEADER_LENGTH + REGION_TABLE_LENGTH);
        ByteCursor cursor(prefix);

        RegionHeader header;
        header.magic = cursor.read_string(REGION_MAGIC_LENGTH);
        header.version = cursor.read_u32(Endian::Big);
        header.blob_count = cursor.read_u32(Endian::Big);
        header.segment_size = cursor.read_u32(Endian::Big);

        if (header.magic != REGION_MAGIC) {
            throw DecodeError(DecodeErrorCode::CorruptFormat,
                              fmt::format("{}: bad region magic", impl_->path.string()), 0, REGION_MAGIC_LENGTH);
        }

        for (auto& segment : impl_->segments) {
            segment = cursor.read_u32(Endian::Big);
        }

        REGIONMAP_LOG_DEBUG(core::log_category::FORMAT, "Opened region {} (version {}, {} blobs, segment size {})",
                            impl_->path.filename().string(), header.version, header.blob_count, header.segment_size);
        impl_->header = std::move(header);
    } catch (const DecodeError&) {
        impl_->file.close();
        throw;
    }

    impl_->is_open = true;
}

void RegionFile::close() {
    if (impl_->is_open) {
        impl_->file.close();
        impl_->is_open = false;
    }
}

bool RegionFile::is_open() const {
    return impl_->is_open;
}

const std::filesystem::path& RegionFile::get_path() const {
    return impl_->path;
}

const RegionHeader& RegionFile::header() const {
    return impl_->header;
}

uint32_t RegionFile::locate_chunk(int32_t relative_x, int32_t relative_z) const {
    if (relative_x < 0 || relative_x >= CHUNKS_PER_SIDE || relative_z < 0 || relative_z >= CHUNKS_PER_SIDE) {
        throw DecodeError(DecodeErrorCode::NotFound,
                          fmt::format("chunk ({}, {}) is outside the region", relative_x, relative_z));
    }
    if (!impl_->is_open) {
        throw DecodeError(DecodeErrorCode::NotFound, fmt::format("region not open: {}", impl_->path.string()));
    }

    uint32_t segment = impl_->segments[chunk_to_index(relative_x, relative_z)];
    if (segment == 0) {
        throw DecodeError(DecodeErrorCode::NotFound,
                          fmt::format("chunk ({}, {}) not present in {}", relative_x, relative_z,
                                      impl_->path.filename().string()));
    }
    return segment;
}

ChunkBlob RegionFile::read_chunk_blob(uint32_t segment) const {
    if (!impl_->is_open) {
        throw DecodeError(DecodeErrorCode::NotFound, fmt::format("region not open: {}", impl_->path.string()));
    }

    const uint64_t location =
        static_cast<uint64_t>(segment) * impl_->header.segment_size + REGION_HEADER_LENGTH;

    std::vector<uint8_t> prefix = impl_->read_at(location, CHUNK_BLOB_PREFIX_LENGTH);
    ByteCursor cursor(prefix);

    ChunkBlob blob;
    blob.uncompressed_size = cursor.read_u32(Endian::Big);
    uint32_t compressed_size = cursor.read_u32(Endian::Big);
    blob.compressed = impl_->read_at(location + CHUNK_BLOB_PREFIX_LENGTH, compressed_size);

    REGIONMAP_LOG_TRACE(core::log_category::FORMAT, "Segment {}: {} compressed, {} uncompressed", segment,
                        compressed_size, blob.uncompressed_size);
    return blob;
}

ChunkDocument RegionFile::read_chunk(int32_t relative_x, int32_t relative_z) const {
    ChunkBlob blob = read_chunk_blob(locate_chunk(relative_x, relative_z));
    return decode_chunk_payload(blob.compressed, blob.uncompressed_size);
}

bool RegionFile::has_chunk(int32_t relative_x, int32_t relative_z) const {
    if (!impl_->is_open || relative_x < 0 || relative_x >= CHUNKS_PER_SIDE || relative_z < 0 ||
        relative_z >= CHUNKS_PER_SIDE) {
        return false;
    }
    return impl_->segments[chunk_to_index(relative_x, relative_z)] != 0;
}

size_t RegionFile::chunk_count() const {
    size_t count = 0;
    for (uint32_t segment : impl_->segments) {
        if (segment != 0) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// RegionReader Implementation
// ============================================================================

struct RegionReader::Impl {
    std::filesystem::path directory;
};

RegionReader::RegionReader(const std::filesystem::path& chunks_directory) : impl_(std::make_unique<Impl>()) {
    impl_->directory = chunks_directory;
}

RegionReader::~RegionReader() = default;

ChunkDocument RegionReader::read_chunk(const ChunkPos& chunk) const {
    RegionFile region(get_region_path(chunk));
    region.open();

    glm::ivec2 local = chunk_local_in_region(chunk);
    return region.read_chunk(local.x, local.y);
}

bool RegionReader::has_chunk(const ChunkPos& chunk) const {
    RegionFile region(get_region_path(chunk));
    try {
        region.open();
    } catch (const DecodeError& e) {
        REGIONMAP_LOG_DEBUG(core::log_category::FORMAT, "{}", e.what());
        return false;
    }

    glm::ivec2 local = chunk_local_in_region(chunk);
    return region.has_chunk(local.x, local.y);
}

std::filesystem::path RegionReader::get_region_path(const ChunkPos& chunk) const {
    glm::ivec2 region_pos = chunk_to_region(chunk);
    return impl_->directory / fmt::format("{}.{}.region.bin", region_pos.x, region_pos.y);
}

const std::filesystem::path& RegionReader::get_directory() const {
    return impl_->directory;
}

}  // namespace regionmap::world
