#pragma once

#include "draw/Surface.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

// glibc's <limits.h> defines CHAR_WIDTH as a macro; it clashes with the
// member below.
#undef CHAR_WIDTH

namespace lazybar::test {

// In-memory surface: fills land in a pixel buffer, text is recorded and
// measured at a fixed advance per byte.
class RecordingSurface : public draw::Surface {
public:
    static constexpr int CHAR_WIDTH = 7;
    static constexpr int TEXT_HEIGHT = 12;

    struct TextCall {
        double x;
        double y;
        std::string text;
        std::string font;
    };

    RecordingSurface(int width, int height)
        : width_(width), height_(height), pixels_(static_cast<size_t>(width * height), 0) {}

    void fill_rect(double x, double y, double width, double height, const draw::Color& color) override {
        int x0 = std::max(0, static_cast<int>(std::lround(origin_x() + x)));
        int y0 = std::max(0, static_cast<int>(std::lround(origin_y() + y)));
        int x1 = std::min(width_, static_cast<int>(std::lround(origin_x() + x + width)));
        int y1 = std::min(height_, static_cast<int>(std::lround(origin_y() + y + height)));
        for (int row = y0; row < y1; ++row) {
            for (int col = x0; col < x1; ++col) {
                pixels_[static_cast<size_t>(row * width_ + col)] = color.packed();
            }
        }
    }

    void draw_text(double x, double y, const std::string& text, const std::string& font,
                   const draw::Color&) override {
        texts.push_back({origin_x() + x, origin_y() + y, text, font});
    }

    draw::TextSize text_size(const std::string& text, const std::string&) override {
        return {static_cast<int>(text.size()) * CHAR_WIDTH, TEXT_HEIGHT};
    }

    void flush() override { flushes++; }

    uint32_t pixel(int x, int y) const { return pixels_[static_cast<size_t>(y * width_ + x)]; }
    const std::vector<uint32_t>& pixels() const { return pixels_; }

    std::vector<TextCall> texts;
    int flushes = 0;

private:
    int width_;
    int height_;
    std::vector<uint32_t> pixels_;
};

}  // namespace lazybar::test
