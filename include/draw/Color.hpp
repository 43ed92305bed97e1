#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lazybar::draw {

// 8-bit RGBA. Parsed from "#rrggbb" or "#rrggbbaa".
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    static std::optional<Color> parse(const std::string& text);

    uint32_t packed() const {
        return (uint32_t(r) << 24) | (uint32_t(g) << 16) | (uint32_t(b) << 8) | uint32_t(a);
    }

    bool operator==(const Color& other) const = default;
};

}  // namespace lazybar::draw
