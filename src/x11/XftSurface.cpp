#include "x11/BarWindow.hpp"
#include "x11/XftSurface.hpp"
#include "util/Logger.hpp"
#include <cmath>

namespace lazybar::x11 {

using util::Logger;

XftSurface::XftSurface(BarWindow& window) : window_(window) {}

XftSurface::~XftSurface() {
    if (!display_) return;
    for (auto& [pattern, font] : fonts_) {
        XftFontClose(display_, font);
    }
    for (auto& [packed, color] : colors_) {
        XftColorFree(display_, window_.visual(), window_.colormap(), &color);
    }
    if (draw_) XftDrawDestroy(draw_);
    if (gc_) XFreeGC(display_, gc_);
    if (pixmap_) XFreePixmap(display_, pixmap_);
}

bool XftSurface::init() {
    display_ = window_.display();
    if (!display_) {
        Logger::error("XftSurface: Window has no display");
        return false;
    }

    XWindowAttributes attrs;
    if (!XGetWindowAttributes(display_, window_.window(), &attrs)) {
        Logger::error("XftSurface: Cannot query window attributes");
        return false;
    }

    pixmap_ = XCreatePixmap(display_, window_.window(), static_cast<unsigned>(window_.width()),
                            static_cast<unsigned>(window_.height()), static_cast<unsigned>(attrs.depth));
    gc_ = XCreateGC(display_, pixmap_, 0, nullptr);
    draw_ = XftDrawCreate(display_, pixmap_, window_.visual(), window_.colormap());
    if (!draw_) {
        Logger::error("XftSurface: XftDrawCreate failed");
        return false;
    }
    return true;
}

XftFont* XftSurface::font(const std::string& pattern) {
    auto it = fonts_.find(pattern);
    if (it != fonts_.end()) return it->second;

    XftFont* opened = XftFontOpenName(display_, window_.screen(), pattern.c_str());
    if (!opened) {
        throw draw::DrawError("Cannot open font " + pattern);
    }
    Logger::debug("XftSurface: Opened font " + pattern);
    fonts_.emplace(pattern, opened);
    return opened;
}

XftColor* XftSurface::color(const draw::Color& color) {
    auto it = colors_.find(color.packed());
    if (it != colors_.end()) return &it->second;

    // XRender wants 16-bit premultiplied channels
    auto channel = [&color](uint8_t value) {
        return static_cast<unsigned short>(value * color.a / 255 * 257);
    };
    XRenderColor render;
    render.red = channel(color.r);
    render.green = channel(color.g);
    render.blue = channel(color.b);
    render.alpha = static_cast<unsigned short>(color.a * 257);

    XftColor allocated;
    if (!XftColorAllocValue(display_, window_.visual(), window_.colormap(), &render, &allocated)) {
        throw draw::DrawError("Cannot allocate color");
    }
    return &colors_.emplace(color.packed(), allocated).first->second;
}

void XftSurface::fill_rect(double x, double y, double width, double height, const draw::Color& fill) {
    if (width <= 0 || height <= 0) return;
    int left = static_cast<int>(std::lround(origin_x() + x));
    int top = static_cast<int>(std::lround(origin_y() + y));
    // Round edges, not sizes, so adjacent rectangles leave no gaps
    int right = static_cast<int>(std::lround(origin_x() + x + width));
    int bottom = static_cast<int>(std::lround(origin_y() + y + height));
    if (right <= left || bottom <= top) return;

    XftDrawRect(draw_, color(fill), left, top, static_cast<unsigned>(right - left),
                static_cast<unsigned>(bottom - top));
}

void XftSurface::draw_text(double x, double y, const std::string& text, const std::string& pattern,
                           const draw::Color& fg) {
    if (text.empty()) return;
    XftFont* face = font(pattern);
    int left = static_cast<int>(std::lround(origin_x() + x));
    int baseline = static_cast<int>(std::lround(origin_y() + y)) + face->ascent;
    XftDrawStringUtf8(draw_, color(fg), face, left, baseline, reinterpret_cast<const FcChar8*>(text.data()),
                      static_cast<int>(text.size()));
}

draw::TextSize XftSurface::text_size(const std::string& text, const std::string& pattern) {
    XftFont* face = font(pattern);
    XGlyphInfo extents;
    XftTextExtentsUtf8(display_, face, reinterpret_cast<const FcChar8*>(text.data()), static_cast<int>(text.size()),
                       &extents);
    return draw::TextSize{extents.xOff, face->ascent + face->descent};
}

void XftSurface::flush() {
    XCopyArea(display_, pixmap_, window_.window(), gc_, 0, 0, static_cast<unsigned>(window_.width()),
              static_cast<unsigned>(window_.height()), 0, 0);
    XFlush(display_);
}

}  // namespace lazybar::x11
