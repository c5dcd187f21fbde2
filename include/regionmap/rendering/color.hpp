// regionmap Rendering
// color.hpp - 8-bit RGB color and hex parsing

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace regionmap::rendering {

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb&) const = default;
};

inline constexpr Rgb RGB_BLACK{0, 0, 0};
inline constexpr Rgb RGB_WHITE{255, 255, 255};

// Parse "#RRGGBB" (leading '#' optional, case-insensitive)
[[nodiscard]] std::optional<Rgb> parse_hex_color(std::string_view text);

inline std::ostream& operator<<(std::ostream& os, const Rgb& color) {
    return os << "(" << static_cast<int>(color.r) << ", " << static_cast<int>(color.g) << ", "
              << static_cast<int>(color.b) << ")";
}

}  // namespace regionmap::rendering
