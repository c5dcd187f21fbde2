// regionmap World Format
// chunk_document.hpp - Typed chunk document and compressed payload decoding

#pragma once

#include "types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace regionmap::world {

struct BlockComponent {
    int32_t version = 0;
    std::vector<uint8_t> data;
};

struct FluidComponent {
    std::vector<uint8_t> data;
};

// One 32-block-tall vertical slice. Absent components mean "all empty".
struct SectionDocument {
    std::optional<BlockComponent> block;
    std::optional<FluidComponent> fluid;
};

// Chunk document after schema validation. Sections are ordered bottom to top.
struct ChunkDocument {
    std::array<SectionDocument, SECTIONS_PER_CHUNK> sections;
    std::optional<std::vector<uint8_t>> block_chunk;  // Heightmap/tint blob
};

// Decompress a zstd frame. Throws DecodeError(CorruptPayload) on failure.
// `size_hint` is only used to pre-size the output buffer.
[[nodiscard]] std::vector<uint8_t> decompress_payload(std::span<const uint8_t> compressed, size_t size_hint = 0);

// Deserialize a BSON chunk document and validate its shape.
// Throws DecodeError(CorruptPayload) for malformed BSON and
// DecodeError(CorruptFormat) for schema violations.
[[nodiscard]] ChunkDocument parse_chunk_document(std::span<const uint8_t> bson);

// decompress_payload followed by parse_chunk_document
[[nodiscard]] ChunkDocument decode_chunk_payload(std::span<const uint8_t> compressed, size_t size_hint = 0);

}  // namespace regionmap::world
