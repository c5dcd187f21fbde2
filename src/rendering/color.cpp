// regionmap Rendering
// color.cpp - Hex color parsing

#include <regionmap/rendering/color.hpp>

namespace regionmap::rendering {

namespace {

std::optional<uint8_t> hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

}  // namespace

std::optional<Rgb> parse_hex_color(std::string_view text) {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6) {
        return std::nullopt;
    }

    uint8_t channels[3];
    for (size_t i = 0; i < 3; ++i) {
        auto high = hex_digit(text[i * 2]);
        auto low = hex_digit(text[i * 2 + 1]);
        if (!high || !low) {
            return std::nullopt;
        }
        channels[i] = static_cast<uint8_t>((*high << 4) | *low);
    }
    return Rgb{channels[0], channels[1], channels[2]};
}

}  // namespace regionmap::rendering
