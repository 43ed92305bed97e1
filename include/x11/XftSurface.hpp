#pragma once

#include "draw/Surface.hpp"
#include <X11/Xft/Xft.h>
#include <X11/Xlib.h>
#include <cstdint>
#include <map>
#include <string>

namespace lazybar::x11 {

class BarWindow;

/**
 * Surface backed by an off-screen pixmap drawn with Xft. flush() copies
 * the pixmap to the window. Fonts are fontconfig patterns
 * ("monospace:size=10"), opened once and cached.
 */
class XftSurface : public draw::Surface {
public:
    explicit XftSurface(BarWindow& window);
    ~XftSurface() override;

    XftSurface(const XftSurface&) = delete;
    XftSurface& operator=(const XftSurface&) = delete;

    [[nodiscard]] bool init();

    void fill_rect(double x, double y, double width, double height, const draw::Color& color) override;
    void draw_text(double x, double y, const std::string& text, const std::string& font,
                   const draw::Color& color) override;
    draw::TextSize text_size(const std::string& text, const std::string& font) override;
    void flush() override;

private:
    XftFont* font(const std::string& pattern);
    XftColor* color(const draw::Color& color);

    BarWindow& window_;
    Display* display_ = nullptr;
    Pixmap pixmap_ = 0;
    GC gc_ = nullptr;
    XftDraw* draw_ = nullptr;

    std::map<std::string, XftFont*> fonts_;
    std::map<uint32_t, XftColor> colors_;
};

}  // namespace lazybar::x11
