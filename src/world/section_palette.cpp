// regionmap World Format
// section_palette.cpp - Palette-indexed block and fluid section decoding

#include <regionmap/core/logger.hpp>
#include <regionmap/world/byte_cursor.hpp>
#include <regionmap/world/decode_error.hpp>
#include <regionmap/world/section_palette.hpp>

namespace regionmap::world {

// ============================================================================
// Encoding Helpers
// ============================================================================

std::optional<PaletteEncoding> palette_encoding_from_byte(uint8_t value) {
    switch (value) {
        case 0:
            return PaletteEncoding::Empty;
        case 1:
            return PaletteEncoding::HalfByte;
        case 2:
            return PaletteEncoding::Byte;
        case 3:
            return PaletteEncoding::Short;
        default:
            return std::nullopt;
    }
}

const char* palette_encoding_to_string(PaletteEncoding encoding) {
    switch (encoding) {
        case PaletteEncoding::Empty:
            return "Empty";
        case PaletteEncoding::HalfByte:
            return "HalfByte";
        case PaletteEncoding::Byte:
            return "Byte";
        case PaletteEncoding::Short:
            return "Short";
    }
    return "Unknown";
}

size_t index_array_size(PaletteEncoding encoding) {
    switch (encoding) {
        case PaletteEncoding::Empty:
            return 0;
        case PaletteEncoding::HalfByte:
            return SECTION_VOLUME / 2;
        case PaletteEncoding::Byte:
            return SECTION_VOLUME;
        case PaletteEncoding::Short:
            return SECTION_VOLUME * 2;
    }
    return 0;
}

uint16_t read_palette_id(std::span<const uint8_t> array, PaletteEncoding encoding, size_t flat_index) {
    switch (encoding) {
        case PaletteEncoding::HalfByte: {
            uint8_t packed = array[flat_index / 2];
            return (flat_index % 2 == 0) ? (packed & 0x0F) : ((packed >> 4) & 0x0F);
        }
        case PaletteEncoding::Byte:
            return array[flat_index];
        case PaletteEncoding::Short:
            return static_cast<uint16_t>((static_cast<uint16_t>(array[flat_index * 2]) << 8) |
                                         array[flat_index * 2 + 1]);
        case PaletteEncoding::Empty:
            break;
    }
    return 0;
}

// ============================================================================
// Palette
// ============================================================================

void Palette::add(PaletteEntry entry) {
    auto it = by_id_.find(entry.id);
    if (it != by_id_.end()) {
        entries_[it->second] = std::move(entry);
        return;
    }
    by_id_.emplace(entry.id, entries_.size());
    entries_.push_back(std::move(entry));
}

const PaletteEntry* Palette::find(uint16_t id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

std::string_view Palette::name_of(uint16_t id) const {
    const PaletteEntry* entry = find(id);
    return entry ? std::string_view(entry->name) : EMPTY_NAME;
}

// ============================================================================
// Block Section
// ============================================================================

std::string_view BlockSection::block_at(int32_t x, int32_t y, int32_t z) const {
    if (!has_indices()) {
        return EMPTY_NAME;
    }
    return palette.name_of(read_palette_id(indices, encoding, cell_index(x, y, z)));
}

BlockSection decode_block_section(std::span<const uint8_t> bytes) {
    ByteCursor cursor(bytes);
    BlockSection section;

    section.unknown_leading = cursor.read_u32(Endian::Big);
    const size_t encoding_offset = cursor.position();
    uint8_t packing = cursor.read_u8();
    auto encoding = palette_encoding_from_byte(packing);
    if (!encoding) {
        throw DecodeError(DecodeErrorCode::CorruptFormat,
                          fmt::format("unknown block palette packing 0x{:02X}", packing), encoding_offset, 1);
    }
    section.encoding = *encoding;

    uint16_t palette_length = cursor.read_u16(Endian::Big);
    section.unknown_trailing = cursor.read_i8();

    for (uint16_t i = 0; i < palette_length; ++i) {
        PaletteEntry entry;
        entry.id = i;
        uint16_t name_length = cursor.read_u16(Endian::Big);
        entry.name = cursor.read_string(name_length);
        entry.count = cursor.read_u16(Endian::Big);
        [[maybe_unused]] int8_t trailing = cursor.read_i8();
        section.palette.add(std::move(entry));
    }

    auto indices = cursor.read_bytes(index_array_size(section.encoding));
    section.indices.assign(indices.begin(), indices.end());
    return section;
}

// ============================================================================
// Fluid Section
// ============================================================================

FluidCell FluidSection::fluid_at(int32_t x, int32_t y, int32_t z) const {
    if (!has_data()) {
        return {EMPTY_NAME, 0};
    }

    const size_t index = cell_index(x, y, z);
    const uint8_t packed = (*levels)[index / 2];
    const uint8_t level = (index % 2 == 0) ? (packed & 0x0F) : ((packed >> 4) & 0x0F);

    if (encoding == PaletteEncoding::Empty) {
        return {EMPTY_NAME, level};
    }
    return {palette.name_of(read_palette_id(*types, encoding, index)), level};
}

FluidSection decode_fluid_section(std::span<const uint8_t> bytes) {
    FluidSection section;
    ByteCursor cursor(bytes);

    try {
        auto encoding = palette_encoding_from_byte(cursor.read_u8());
        if (!encoding) {
            REGIONMAP_LOG_DEBUG(core::log_category::FORMAT, "Fluid section has unknown packing, treating as empty");
            return section;
        }
        section.encoding = *encoding;

        uint16_t palette_length = cursor.read_u16(Endian::Big);
        Palette palette;
        for (uint16_t i = 0; i < palette_length; ++i) {
            PaletteEntry entry;
            entry.id = section.encoding == PaletteEncoding::Short ? cursor.read_u16(Endian::Big) : cursor.read_u8();
            uint16_t name_length = cursor.read_u16(Endian::Big);
            entry.name = cursor.read_string(name_length);
            entry.count = cursor.read_u16(Endian::Big);
            palette.add(std::move(entry));
        }

        auto types = cursor.read_bytes(index_array_size(section.encoding));
        auto levels = cursor.read_bytes(FLUID_LEVEL_ARRAY_SIZE);

        section.palette = std::move(palette);
        section.types.emplace(types.begin(), types.end());
        section.levels.emplace(levels.begin(), levels.end());
    } catch (const DecodeError& e) {
        REGIONMAP_LOG_DEBUG(core::log_category::FORMAT, "Fluid section truncated, treating as empty: {}", e.what());
        section.types.reset();
        section.levels.reset();
    }

    return section;
}

}  // namespace regionmap::world
