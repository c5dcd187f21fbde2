// regionmap World Format
// section_palette.hpp - Palette-indexed block and fluid section decoding

#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace regionmap::world {

// ============================================================================
// Palette Encoding
// ============================================================================

// Width of the per-cell palette references, stored on disk as a packing byte
enum class PaletteEncoding : uint8_t {
    Empty = 0,     // No index array; every cell is empty
    HalfByte = 1,  // 4 bits per cell
    Byte = 2,      // 8 bits per cell
    Short = 3      // 16 bits per cell, big-endian
};

[[nodiscard]] std::optional<PaletteEncoding> palette_encoding_from_byte(uint8_t value);
[[nodiscard]] const char* palette_encoding_to_string(PaletteEncoding encoding);

// Bytes occupied by a 32x32x32 index array at the given width
[[nodiscard]] size_t index_array_size(PaletteEncoding encoding);

// Decode the palette id of one cell. Callers must not pass Empty.
[[nodiscard]] uint16_t read_palette_id(std::span<const uint8_t> array, PaletteEncoding encoding, size_t flat_index);

// Level arrays are always 4-bit packed
inline constexpr size_t FLUID_LEVEL_ARRAY_SIZE = SECTION_VOLUME / 2;

inline constexpr std::string_view EMPTY_NAME = "Empty";

// ============================================================================
// Palette
// ============================================================================

struct PaletteEntry {
    uint16_t id = 0;
    std::string name;
    uint16_t count = 0;  // Occurrences in the section, as stored
};

class Palette {
public:
    // Later entries with a duplicate id replace earlier ones
    void add(PaletteEntry entry);

    // Name for an id, or "Empty" when the id has no entry
    [[nodiscard]] std::string_view name_of(uint16_t id) const;
    [[nodiscard]] const PaletteEntry* find(uint16_t id) const;

    [[nodiscard]] const std::vector<PaletteEntry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::vector<PaletteEntry> entries_;
    std::unordered_map<uint16_t, size_t> by_id_;
};

// ============================================================================
// Block Section
// ============================================================================

struct BlockSection {
    uint32_t unknown_leading = 0;  // Opaque, preserved as read
    PaletteEncoding encoding = PaletteEncoding::Empty;
    int8_t unknown_trailing = 0;  // Opaque, preserved as read
    Palette palette;
    std::vector<uint8_t> indices;  // Empty when encoding is Empty

    [[nodiscard]] bool has_indices() const { return encoding != PaletteEncoding::Empty; }

    // Block name at local coordinates; "Empty" for Empty sections
    [[nodiscard]] std::string_view block_at(int32_t x, int32_t y, int32_t z) const;
};

// Palette ids are positional (entry order), not stored.
// Throws DecodeError(CorruptFormat) on truncation or an unknown packing byte.
[[nodiscard]] BlockSection decode_block_section(std::span<const uint8_t> bytes);

// ============================================================================
// Fluid Section
// ============================================================================

struct FluidCell {
    std::string_view name;
    uint8_t level = 0;

    [[nodiscard]] bool is_present() const { return level > 0 && name != EMPTY_NAME; }
};

struct FluidSection {
    PaletteEncoding encoding = PaletteEncoding::Empty;
    Palette palette;
    std::optional<std::vector<uint8_t>> types;   // nullopt = no fluid data
    std::optional<std::vector<uint8_t>> levels;  // nullopt = no fluid data

    [[nodiscard]] bool has_data() const { return types.has_value() && levels.has_value(); }

    // Fluid at local coordinates; level 0 / "Empty" when absent
    [[nodiscard]] FluidCell fluid_at(int32_t x, int32_t y, int32_t z) const;
};

// Palette ids are stored explicitly. Never throws: any structural anomaly
// yields a section whose types/levels are nullopt.
[[nodiscard]] FluidSection decode_fluid_section(std::span<const uint8_t> bytes);

}  // namespace regionmap::world
