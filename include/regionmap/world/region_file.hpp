// regionmap World Format
// region_file.hpp - Region container parsing and chunk lookup

#pragma once

#include "chunk_document.hpp"
#include "types.hpp"

#include <array>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace regionmap::world {

// ============================================================================
// Region Header (binary layout, all fields big-endian)
// ============================================================================

inline constexpr size_t REGION_HEADER_LENGTH = 32;
inline constexpr size_t REGION_MAGIC_LENGTH = 20;
inline constexpr std::string_view REGION_MAGIC = "HytaleIndexedStorage";
inline constexpr size_t REGION_TABLE_LENGTH = CHUNKS_PER_REGION * 4;
inline constexpr size_t CHUNK_BLOB_PREFIX_LENGTH = 8;

static_assert(REGION_MAGIC.size() == REGION_MAGIC_LENGTH, "Region magic must be 20 bytes");

struct RegionHeader {
    std::string magic;
    uint32_t version = 0;
    uint32_t blob_count = 0;
    uint32_t segment_size = 0;
};

struct ChunkBlob {
    uint32_t uncompressed_size = 0;  // Declared size, not verified
    std::vector<uint8_t> compressed;
};

// ============================================================================
// Region File (32x32 chunks per file, read-only)
// ============================================================================

class RegionFile {
public:
    static constexpr int32_t CHUNKS_PER_SIDE = REGION_SIZE;
    static constexpr int32_t TOTAL_CHUNKS = CHUNKS_PER_REGION;

    explicit RegionFile(const std::filesystem::path& path);
    ~RegionFile();

    // Non-copyable
    RegionFile(const RegionFile&) = delete;
    RegionFile& operator=(const RegionFile&) = delete;

    // Reads and validates the header and location table.
    // Throws DecodeError: NotFound if the file is missing, CorruptFormat on
    // a short header/table or a magic mismatch.
    void open();
    void close();
    [[nodiscard]] bool is_open() const;
    [[nodiscard]] const std::filesystem::path& get_path() const;
    [[nodiscard]] const RegionHeader& header() const;

    // Segment index for a chunk relative to this region.
    // Throws DecodeError(NotFound) if the slot is empty or out of range.
    [[nodiscard]] uint32_t locate_chunk(int32_t relative_x, int32_t relative_z) const;

    // Throws DecodeError(CorruptFormat) if the blob is truncated
    [[nodiscard]] ChunkBlob read_chunk_blob(uint32_t segment) const;

    // locate_chunk + read_chunk_blob + decode_chunk_payload
    [[nodiscard]] ChunkDocument read_chunk(int32_t relative_x, int32_t relative_z) const;

    [[nodiscard]] bool has_chunk(int32_t relative_x, int32_t relative_z) const;
    [[nodiscard]] size_t chunk_count() const;

    [[nodiscard]] static size_t chunk_to_index(int32_t relative_x, int32_t relative_z) {
        return static_cast<size_t>(relative_x + relative_z * CHUNKS_PER_SIDE);
    }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Region Reader (resolves world chunk positions to region files)
// ============================================================================

class RegionReader {
public:
    explicit RegionReader(const std::filesystem::path& chunks_directory);
    ~RegionReader();

    // Non-copyable
    RegionReader(const RegionReader&) = delete;
    RegionReader& operator=(const RegionReader&) = delete;

    // Opens the owning region file for the duration of the call.
    // Throws DecodeError (NotFound, CorruptFormat, CorruptPayload).
    [[nodiscard]] ChunkDocument read_chunk(const ChunkPos& chunk) const;

    [[nodiscard]] bool has_chunk(const ChunkPos& chunk) const;

    // Region file path for a chunk: <rx>.<rz>.region.bin
    [[nodiscard]] std::filesystem::path get_region_path(const ChunkPos& chunk) const;
    [[nodiscard]] const std::filesystem::path& get_directory() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace regionmap::world
