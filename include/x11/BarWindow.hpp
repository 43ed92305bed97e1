#pragma once

#include "bar/Bar.hpp"
#include "config/ConfigLoader.hpp"
#include <X11/Xlib.h>
#include <string>

namespace lazybar::runtime {
class Shutdown;
}

namespace lazybar::x11 {

/**
 * The bar's dock window: screen-wide, anchored to the top or bottom edge,
 * with struts reserving its space from other clients.
 */
class BarWindow : public bar::WindowControl {
public:
    BarWindow(std::string name, config::Position position, int height);
    ~BarWindow() override;

    BarWindow(const BarWindow&) = delete;
    BarWindow& operator=(const BarWindow&) = delete;

    [[nodiscard]] bool init();

    // Xlib errors are logged; losing the connection runs the shutdown hooks
    // and exits.
    static void install_error_handlers(runtime::Shutdown& shutdown);

    Display* display() const { return display_; }
    ::Window window() const { return window_; }
    Visual* visual() const { return visual_; }
    Colormap colormap() const { return colormap_; }
    int screen() const { return screen_; }
    int width() const { return width_; }
    int height() const { return height_; }
    int connection_fd() const;

    void map() override;
    void unmap() override;
    bool is_mapped() const override { return mapped_; }

private:
    void set_dock_properties();

    std::string name_;
    config::Position position_;
    int height_;

    Display* display_ = nullptr;
    ::Window window_ = 0;
    Visual* visual_ = nullptr;
    Colormap colormap_ = 0;
    int screen_ = 0;
    int width_ = 0;
    int y_ = 0;
    bool mapped_ = false;
};

}  // namespace lazybar::x11
