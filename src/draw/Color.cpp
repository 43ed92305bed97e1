#include "draw/Color.hpp"
#include <charconv>

namespace lazybar::draw {

static std::optional<uint8_t> parse_channel(const std::string& text, size_t pos) {
    unsigned value = 0;
    auto first = text.data() + pos;
    auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
    if (ec != std::errc() || ptr != first + 2) return std::nullopt;
    return static_cast<uint8_t>(value);
}

std::optional<Color> Color::parse(const std::string& text) {
    if (text.empty() || text[0] != '#') return std::nullopt;
    if (text.size() != 7 && text.size() != 9) return std::nullopt;

    auto r = parse_channel(text, 1);
    auto g = parse_channel(text, 3);
    auto b = parse_channel(text, 5);
    if (!r || !g || !b) return std::nullopt;

    Color color{*r, *g, *b, 255};
    if (text.size() == 9) {
        auto a = parse_channel(text, 7);
        if (!a) return std::nullopt;
        color.a = *a;
    }
    return color;
}

}  // namespace lazybar::draw
