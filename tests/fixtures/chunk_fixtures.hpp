// regionmap Tests
// chunk_fixtures.hpp - Builders for synthetic sections, chunk documents and region files

#pragma once

#include <nlohmann/json.hpp>
#include <zstd.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <regionmap/world/block_chunk_data.hpp>
#include <regionmap/world/chunk_document.hpp>
#include <regionmap/world/region_file.hpp>
#include <regionmap/world/section_palette.hpp>
#include <regionmap/world/types.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace regionmap::test {

// Appends big- and little-endian fields to a byte buffer
class ByteWriter {
public:
    ByteWriter& u8(uint8_t value) {
        bytes_.push_back(value);
        return *this;
    }

    ByteWriter& u16_be(uint16_t value) {
        bytes_.push_back(static_cast<uint8_t>(value >> 8));
        bytes_.push_back(static_cast<uint8_t>(value));
        return *this;
    }

    ByteWriter& u32_be(uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            bytes_.push_back(static_cast<uint8_t>(value >> shift));
        }
        return *this;
    }

    ByteWriter& u16_le(uint16_t value) {
        bytes_.push_back(static_cast<uint8_t>(value));
        bytes_.push_back(static_cast<uint8_t>(value >> 8));
        return *this;
    }

    ByteWriter& u32_le(uint32_t value) {
        for (int shift = 0; shift <= 24; shift += 8) {
            bytes_.push_back(static_cast<uint8_t>(value >> shift));
        }
        return *this;
    }

    ByteWriter& str(const std::string& text) {
        bytes_.insert(bytes_.end(), text.begin(), text.end());
        return *this;
    }

    ByteWriter& raw(const std::vector<uint8_t>& data) {
        bytes_.insert(bytes_.end(), data.begin(), data.end());
        return *this;
    }

    ByteWriter& zeros(size_t count) {
        bytes_.insert(bytes_.end(), count, 0);
        return *this;
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const { return bytes_; }
    [[nodiscard]] std::vector<uint8_t> take() { return std::move(bytes_); }

private:
    std::vector<uint8_t> bytes_;
};

// Write a palette id into an index array at the given width
inline void write_palette_id(std::vector<uint8_t>& array, world::PaletteEncoding encoding, size_t index,
                             uint16_t id) {
    switch (encoding) {
        case world::PaletteEncoding::HalfByte:
            if (index % 2 == 0) {
                array[index / 2] = static_cast<uint8_t>((array[index / 2] & 0xF0) | (id & 0x0F));
            } else {
                array[index / 2] = static_cast<uint8_t>((array[index / 2] & 0x0F) | ((id & 0x0F) << 4));
            }
            break;
        case world::PaletteEncoding::Byte:
            array[index] = static_cast<uint8_t>(id);
            break;
        case world::PaletteEncoding::Short:
            array[index * 2] = static_cast<uint8_t>(id >> 8);
            array[index * 2 + 1] = static_cast<uint8_t>(id);
            break;
        case world::PaletteEncoding::Empty:
            break;
    }
}

// Serialized block section. `names` become palette ids 0..n-1 in order;
// `cells` maps cell_index to palette id (all other cells reference id 0).
inline std::vector<uint8_t> encode_block_section(world::PaletteEncoding encoding,
                                                 const std::vector<std::string>& names,
                                                 const std::map<size_t, uint16_t>& cells) {
    ByteWriter writer;
    writer.u32_be(0).u8(static_cast<uint8_t>(encoding)).u16_be(static_cast<uint16_t>(names.size())).u8(0);
    for (const auto& name : names) {
        writer.u16_be(static_cast<uint16_t>(name.size())).str(name).u16_be(1).u8(0);
    }

    std::vector<uint8_t> indices(world::index_array_size(encoding), 0);
    for (const auto& [index, id] : cells) {
        write_palette_id(indices, encoding, index, id);
    }
    writer.raw(indices);
    return writer.take();
}

struct FluidPaletteEntry {
    uint16_t id;
    std::string name;
};

struct FluidCellValue {
    uint16_t id;
    uint8_t level;
};

// Serialized fluid section with explicit palette ids
inline std::vector<uint8_t> encode_fluid_section(world::PaletteEncoding encoding,
                                                 const std::vector<FluidPaletteEntry>& palette,
                                                 const std::map<size_t, FluidCellValue>& cells) {
    ByteWriter writer;
    writer.u8(static_cast<uint8_t>(encoding)).u16_be(static_cast<uint16_t>(palette.size()));
    for (const auto& entry : palette) {
        if (encoding == world::PaletteEncoding::Short) {
            writer.u16_be(entry.id);
        } else {
            writer.u8(static_cast<uint8_t>(entry.id));
        }
        writer.u16_be(static_cast<uint16_t>(entry.name.size())).str(entry.name).u16_be(1);
    }

    std::vector<uint8_t> types(world::index_array_size(encoding), 0);
    std::vector<uint8_t> levels(world::FLUID_LEVEL_ARRAY_SIZE, 0);
    for (const auto& [index, cell] : cells) {
        write_palette_id(types, encoding, index, cell.id);
        write_palette_id(levels, world::PaletteEncoding::HalfByte, index, cell.level);
    }
    writer.raw(types).raw(levels);
    return writer.take();
}

inline std::vector<uint8_t> zstd_compress(const std::vector<uint8_t>& raw) {
    std::vector<uint8_t> out(ZSTD_compressBound(raw.size()));
    size_t written = ZSTD_compress(out.data(), out.size(), raw.data(), raw.size(), 3);
    if (ZSTD_isError(written)) {
        throw std::runtime_error(ZSTD_getErrorName(written));
    }
    out.resize(written);
    return out;
}

// Builds a chunk document cell by cell, using Byte-encoded sections
class ChunkBuilder {
public:
    ChunkBuilder& set_block(int32_t x, int32_t world_y, int32_t z, const std::string& name) {
        auto& section = blocks_[world_y / world::SECTION_HEIGHT];
        section.cells[world::cell_index(x, world_y, z)] = section.intern(name);
        return *this;
    }

    ChunkBuilder& fill_layer(int32_t world_y, const std::string& name) {
        for (int32_t z = 0; z < world::CHUNK_SIZE; ++z) {
            for (int32_t x = 0; x < world::CHUNK_SIZE; ++x) {
                set_block(x, world_y, z, name);
            }
        }
        return *this;
    }

    ChunkBuilder& set_fluid(int32_t x, int32_t world_y, int32_t z, const std::string& name, uint8_t level) {
        auto& section = fluids_[world_y / world::SECTION_HEIGHT];
        section.cells[world::cell_index(x, world_y, z)] = FluidCellValue{section.intern(name), level};
        return *this;
    }

    ChunkBuilder& set_block_chunk(std::vector<uint8_t> data) {
        block_chunk_ = std::move(data);
        return *this;
    }

    [[nodiscard]] nlohmann::json to_json(size_t section_count = world::SECTIONS_PER_CHUNK) const {
        using json = nlohmann::json;

        json sections = json::array();
        for (size_t i = 0; i < section_count; ++i) {
            json components = json::object();
            auto block = blocks_.find(static_cast<int32_t>(i));
            if (block != blocks_.end()) {
                components["Block"] = {{"Version", 1},
                                       {"Data", json::binary(encode_block_section(world::PaletteEncoding::Byte,
                                                                                  block->second.names,
                                                                                  block->second.cells))}};
            }
            auto fluid = fluids_.find(static_cast<int32_t>(i));
            if (fluid != fluids_.end()) {
                components["Fluid"] = {{"Data", json::binary(encode_fluid_section(world::PaletteEncoding::Byte,
                                                                                  fluid->second.palette,
                                                                                  fluid->second.cells))}};
            }
            sections.push_back(json{{"Components", components}});
        }

        json root = {{"Components", {{"ChunkColumn", {{"Sections", sections}}}}}};
        if (block_chunk_) {
            root["Components"]["BlockChunk"] = {{"Data", json::binary(*block_chunk_)}};
        }
        return root;
    }

    [[nodiscard]] std::vector<uint8_t> to_bson() const { return nlohmann::json::to_bson(to_json()); }
    [[nodiscard]] std::vector<uint8_t> to_compressed() const { return zstd_compress(to_bson()); }
    [[nodiscard]] world::ChunkDocument to_document() const { return world::parse_chunk_document(to_bson()); }

private:
    struct BlockLayer {
        std::vector<std::string> names{std::string(world::EMPTY_NAME)};
        std::map<size_t, uint16_t> cells;

        uint16_t intern(const std::string& name) {
            for (size_t i = 0; i < names.size(); ++i) {
                if (names[i] == name) {
                    return static_cast<uint16_t>(i);
                }
            }
            names.push_back(name);
            return static_cast<uint16_t>(names.size() - 1);
        }
    };

    struct FluidLayer {
        std::vector<FluidPaletteEntry> palette{{0, std::string(world::EMPTY_NAME)}};
        std::map<size_t, FluidCellValue> cells;

        uint16_t intern(const std::string& name) {
            for (const auto& entry : palette) {
                if (entry.name == name) {
                    return entry.id;
                }
            }
            palette.push_back({static_cast<uint16_t>(palette.size()), name});
            return palette.back().id;
        }
    };

    std::map<int32_t, BlockLayer> blocks_;
    std::map<int32_t, FluidLayer> fluids_;
    std::optional<std::vector<uint8_t>> block_chunk_;
};

// Serialized BlockChunk blob (little-endian). Index arrays are given in
// their on-disk orderings: heights x + z*32, tints z + x*32.
inline std::vector<uint8_t> encode_block_chunk(const std::vector<uint16_t>& height_palette,
                                               const std::vector<uint16_t>& height_indices,
                                               const std::vector<uint32_t>& tint_palette,
                                               const std::vector<uint16_t>& tint_indices) {
    ByteWriter writer;
    writer.u8(0);

    writer.u16_le(static_cast<uint16_t>(height_palette.size()));
    for (uint16_t height : height_palette) {
        writer.u16_le(height);
    }
    auto height_packed = world::pack_ten_bit_indices(height_indices);
    writer.u32_le(static_cast<uint32_t>(height_packed.size())).raw(height_packed);

    writer.u16_le(static_cast<uint16_t>(tint_palette.size()));
    for (uint32_t tint : tint_palette) {
        writer.u32_le(tint);
    }
    auto tint_packed = world::pack_ten_bit_indices(tint_indices);
    writer.u32_le(static_cast<uint32_t>(tint_packed.size())).raw(tint_packed);

    return writer.take();
}

// Writes a region file holding the given compressed payloads, keyed by
// relative chunk index (x + z*32). Blobs occupy consecutive segments.
class RegionFileBuilder {
public:
    static constexpr uint32_t SEGMENT_SIZE = 4096;

    RegionFileBuilder& add_chunk(int32_t relative_x, int32_t relative_z, std::vector<uint8_t> compressed,
                                 uint32_t uncompressed_size = 0) {
        chunks_[world::RegionFile::chunk_to_index(relative_x, relative_z)] = {std::move(compressed),
                                                                               uncompressed_size};
        return *this;
    }

    RegionFileBuilder& set_magic(std::string magic) {
        magic_ = std::move(magic);
        return *this;
    }

    // Write this compressed size into every blob prefix instead of the real one
    RegionFileBuilder& declare_compressed_size(uint32_t size) {
        declared_compressed_size_ = size;
        return *this;
    }

    // Drop this many bytes from the end of the written file
    RegionFileBuilder& truncate_tail(size_t count) {
        truncate_ = count;
        return *this;
    }

    [[nodiscard]] std::vector<uint8_t> build() const {
        std::vector<uint32_t> table(world::CHUNKS_PER_REGION, 0);
        std::vector<uint8_t> body;

        // Segment 1 starts right after the location table
        const size_t data_start = world::REGION_HEADER_LENGTH + world::REGION_TABLE_LENGTH;
        uint32_t next_segment = static_cast<uint32_t>(
            (data_start - world::REGION_HEADER_LENGTH + SEGMENT_SIZE - 1) / SEGMENT_SIZE);

        for (const auto& [index, chunk] : chunks_) {
            const size_t offset = static_cast<size_t>(next_segment) * SEGMENT_SIZE + world::REGION_HEADER_LENGTH;
            if (body.size() < offset - data_start) {
                body.resize(offset - data_start, 0);
            }

            ByteWriter blob;
            blob.u32_be(chunk.second)
                .u32_be(declared_compressed_size_.value_or(static_cast<uint32_t>(chunk.first.size())))
                .raw(chunk.first);
            body.insert(body.end(), blob.bytes().begin(), blob.bytes().end());

            table[index] = next_segment;
            const size_t blob_size = blob.bytes().size();
            next_segment += static_cast<uint32_t>((blob_size + SEGMENT_SIZE - 1) / SEGMENT_SIZE);
        }

        ByteWriter writer;
        std::string magic = magic_;
        magic.resize(world::REGION_MAGIC_LENGTH, ' ');
        writer.str(magic).u32_be(1).u32_be(static_cast<uint32_t>(chunks_.size())).u32_be(SEGMENT_SIZE);
        for (uint32_t segment : table) {
            writer.u32_be(segment);
        }
        writer.raw(body);

        std::vector<uint8_t> bytes = writer.take();
        bytes.resize(bytes.size() - std::min(truncate_, bytes.size()));
        return bytes;
    }

    void write(const std::filesystem::path& path) const {
        auto bytes = build();
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

private:
    std::map<size_t, std::pair<std::vector<uint8_t>, uint32_t>> chunks_;
    std::string magic_{world::REGION_MAGIC};
    std::optional<uint32_t> declared_compressed_size_;
    size_t truncate_ = 0;
};

}  // namespace regionmap::test
