// regionmap World Format
// chunk_document.cpp - zstd + BSON chunk payload decoding

#include <nlohmann/json.hpp>
#include <zstd.h>

#include <regionmap/core/logger.hpp>
#include <regionmap/world/chunk_document.hpp>
#include <regionmap/world/decode_error.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>

namespace regionmap::world {

using json = nlohmann::json;

// ============================================================================
// Decompression
// ============================================================================

namespace {

// Upper bound on the up-front reservation; the declared size is untrusted
constexpr size_t MAX_OUTPUT_RESERVE = 16 * 1024 * 1024;

struct DStreamDeleter {
    void operator()(ZSTD_DStream* stream) const { ZSTD_freeDStream(stream); }
};

[[noreturn]] void fail_schema(std::string_view path, std::string_view problem) {
    throw DecodeError(DecodeErrorCode::CorruptFormat, fmt::format("chunk document: {} {}", path, problem));
}

const json& require_object(const json& parent, const char* key, std::string_view path) {
    auto it = parent.find(key);
    if (it == parent.end()) {
        fail_schema(path, "is missing");
    }
    if (!it->is_object()) {
        fail_schema(path, "is not a document");
    }
    return *it;
}

std::vector<uint8_t> require_binary(const json& parent, const char* key, std::string_view path) {
    auto it = parent.find(key);
    if (it == parent.end()) {
        fail_schema(path, "is missing");
    }
    if (!it->is_binary()) {
        fail_schema(path, "is not binary data");
    }
    const auto& binary = it->get_binary();
    return std::vector<uint8_t>(binary.begin(), binary.end());
}

SectionDocument parse_section(const json& section, size_t index) {
    const std::string path = fmt::format("Sections[{}]", index);
    if (!section.is_object()) {
        fail_schema(path, "is not a document");
    }

    SectionDocument result;
    auto components = section.find("Components");
    if (components == section.end()) {
        return result;
    }
    if (!components->is_object()) {
        fail_schema(path + ".Components", "is not a document");
    }

    auto block = components->find("Block");
    if (block != components->end() && !block->is_null()) {
        if (!block->is_object()) {
            fail_schema(path + ".Block", "is not a document");
        }
        BlockComponent component;
        auto version = block->find("Version");
        if (version != block->end()) {
            if (!version->is_number_integer()) {
                fail_schema(path + ".Block.Version", "is not an integer");
            }
            component.version = version->get<int32_t>();
        }
        component.data = require_binary(*block, "Data", path + ".Block.Data");
        result.block = std::move(component);
    }

    auto fluid = components->find("Fluid");
    if (fluid != components->end() && !fluid->is_null()) {
        if (!fluid->is_object()) {
            fail_schema(path + ".Fluid", "is not a document");
        }
        result.fluid = FluidComponent{require_binary(*fluid, "Data", path + ".Fluid.Data")};
    }

    return result;
}

}  // namespace

std::vector<uint8_t> decompress_payload(std::span<const uint8_t> compressed, size_t size_hint) {
    std::unique_ptr<ZSTD_DStream, DStreamDeleter> stream(ZSTD_createDStream());
    if (!stream) {
        throw DecodeError(DecodeErrorCode::CorruptPayload, "failed to allocate zstd stream");
    }

    size_t init = ZSTD_initDStream(stream.get());
    if (ZSTD_isError(init)) {
        throw DecodeError(DecodeErrorCode::CorruptPayload,
                          fmt::format("zstd init failed: {}", ZSTD_getErrorName(init)));
    }

    std::vector<uint8_t> output;
    output.reserve(std::min(size_hint > 0 ? size_hint : compressed.size() * 4, MAX_OUTPUT_RESERVE));
    std::vector<uint8_t> chunk(ZSTD_DStreamOutSize());

    ZSTD_inBuffer input{compressed.data(), compressed.size(), 0};
    size_t last_result = 1;

    while (input.pos < input.size) {
        ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
        last_result = ZSTD_decompressStream(stream.get(), &out, &input);
        if (ZSTD_isError(last_result)) {
            throw DecodeError(DecodeErrorCode::CorruptPayload,
                              fmt::format("zstd decompression failed: {}", ZSTD_getErrorName(last_result)),
                              input.pos, compressed.size());
        }
        output.insert(output.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(out.pos));
    }

    // Drain any output still buffered inside the decoder
    while (last_result != 0) {
        ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
        last_result = ZSTD_decompressStream(stream.get(), &out, &input);
        if (ZSTD_isError(last_result)) {
            throw DecodeError(DecodeErrorCode::CorruptPayload,
                              fmt::format("zstd decompression failed: {}", ZSTD_getErrorName(last_result)),
                              input.pos, compressed.size());
        }
        if (out.pos == 0) {
            break;
        }
        output.insert(output.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(out.pos));
    }

    if (last_result != 0) {
        throw DecodeError(DecodeErrorCode::CorruptPayload, "zstd frame is truncated", compressed.size(), 0);
    }

    if (size_hint > 0 && output.size() != size_hint) {
        REGIONMAP_LOG_DEBUG(core::log_category::FORMAT, "Decompressed {} bytes, header declared {}", output.size(),
                            size_hint);
    }

    return output;
}

// ============================================================================
// Document Parsing
// ============================================================================

ChunkDocument parse_chunk_document(std::span<const uint8_t> bson) {
    json root;
    try {
        root = json::from_bson(bson.begin(), bson.end());
    } catch (const json::exception& e) {
        throw DecodeError(DecodeErrorCode::CorruptPayload, fmt::format("invalid BSON document: {}", e.what()));
    }

    const json& components = require_object(root, "Components", "Components");
    const json& column = require_object(components, "ChunkColumn", "Components.ChunkColumn");

    auto sections = column.find("Sections");
    if (sections == column.end() || !sections->is_array()) {
        fail_schema("Components.ChunkColumn.Sections", "is not an array");
    }
    if (sections->size() != static_cast<size_t>(SECTIONS_PER_CHUNK)) {
        fail_schema("Components.ChunkColumn.Sections",
                    fmt::format("has {} entries, expected {}", sections->size(), SECTIONS_PER_CHUNK));
    }

    ChunkDocument document;
    for (size_t i = 0; i < document.sections.size(); ++i) {
        document.sections[i] = parse_section((*sections)[i], i);
    }

    auto block_chunk = components.find("BlockChunk");
    if (block_chunk != components.end() && block_chunk->is_object() && block_chunk->contains("Data")) {
        document.block_chunk = require_binary(*block_chunk, "Data", "Components.BlockChunk.Data");
    }

    return document;
}

ChunkDocument decode_chunk_payload(std::span<const uint8_t> compressed, size_t size_hint) {
    std::vector<uint8_t> raw = decompress_payload(compressed, size_hint);
    return parse_chunk_document(raw);
}

}  // namespace regionmap::world
