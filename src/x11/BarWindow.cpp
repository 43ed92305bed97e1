#include "x11/BarWindow.hpp"
#include "runtime/Shutdown.hpp"
#include "util/Logger.hpp"
#include <X11/Xatom.h>
#include <X11/Xutil.h>
#include <format>
#include <unistd.h>

namespace lazybar::x11 {

using util::Logger;

namespace {

runtime::Shutdown* g_shutdown = nullptr;

int on_x_error(Display* display, XErrorEvent* event) {
    char text[256] = {0};
    XGetErrorText(display, event->error_code, text, sizeof(text));
    Logger::error(std::format("X11: {} (request {}, resource 0x{:x})", text,
                              static_cast<int>(event->request_code), event->resourceid));
    return 0;
}

int on_x_io_error(Display*) {
    Logger::error("X11: Connection to the X server lost");
    if (g_shutdown) {
        g_shutdown->run_hooks();
    }
    _exit(1);
}

}  // namespace

BarWindow::BarWindow(std::string name, config::Position position, int height)
    : name_(std::move(name)), position_(position), height_(height) {}

BarWindow::~BarWindow() {
    if (display_) {
        if (window_) XDestroyWindow(display_, window_);
        XCloseDisplay(display_);
    }
}

void BarWindow::install_error_handlers(runtime::Shutdown& shutdown) {
    g_shutdown = &shutdown;
    XSetErrorHandler(on_x_error);
    XSetIOErrorHandler(on_x_io_error);
}

bool BarWindow::init() {
    // Panel setup runs on worker threads
    if (!XInitThreads()) {
        Logger::error("BarWindow: XInitThreads failed");
        return false;
    }

    display_ = XOpenDisplay(nullptr);
    if (!display_) {
        Logger::error("BarWindow: Cannot open display");
        return false;
    }

    screen_ = DefaultScreen(display_);
    ::Window root = RootWindow(display_, screen_);
    width_ = DisplayWidth(display_, screen_);
    int screen_height = DisplayHeight(display_, screen_);
    y_ = position_ == config::Position::Top ? 0 : screen_height - height_;

    // Prefer a 32-bit visual so a translucent background reaches the compositor
    XVisualInfo info;
    if (XMatchVisualInfo(display_, screen_, 32, TrueColor, &info)) {
        visual_ = info.visual;
        colormap_ = XCreateColormap(display_, root, visual_, AllocNone);
    } else {
        info.depth = DefaultDepth(display_, screen_);
        visual_ = DefaultVisual(display_, screen_);
        colormap_ = DefaultColormap(display_, screen_);
    }

    XSetWindowAttributes attrs{};
    attrs.colormap = colormap_;
    attrs.border_pixel = 0;
    attrs.background_pixel = 0;
    attrs.override_redirect = False;
    attrs.event_mask = ExposureMask | ButtonPressMask | StructureNotifyMask;

    window_ = XCreateWindow(display_, root, 0, y_, static_cast<unsigned>(width_), static_cast<unsigned>(height_), 0,
                            info.depth, InputOutput, visual_,
                            CWColormap | CWBorderPixel | CWBackPixel | CWOverrideRedirect | CWEventMask, &attrs);
    if (!window_) {
        Logger::error("BarWindow: XCreateWindow failed");
        return false;
    }

    set_dock_properties();

    Logger::info(std::format("BarWindow: Created {}x{} window at y={} (depth {})", width_, height_, y_, info.depth));
    return true;
}

void BarWindow::set_dock_properties() {
    std::string title = "lazybar_" + name_;
    XStoreName(display_, window_, title.c_str());

    XClassHint class_hint;
    class_hint.res_name = const_cast<char*>("lazybar");
    class_hint.res_class = const_cast<char*>("Lazybar");
    XSetClassHint(display_, window_, &class_hint);

    Atom window_type = XInternAtom(display_, "_NET_WM_WINDOW_TYPE", False);
    Atom dock = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_DOCK", False);
    XChangeProperty(display_, window_, window_type, XA_ATOM, 32, PropModeReplace,
                    reinterpret_cast<unsigned char*>(&dock), 1);

    Atom state = XInternAtom(display_, "_NET_WM_STATE", False);
    Atom states[] = {
        XInternAtom(display_, "_NET_WM_STATE_STICKY", False),
        XInternAtom(display_, "_NET_WM_STATE_ABOVE", False),
    };
    XChangeProperty(display_, window_, state, XA_ATOM, 32, PropModeReplace, reinterpret_cast<unsigned char*>(states),
                    2);

    // left, right, top, bottom, then start/end pairs for each edge
    long strut[12] = {0};
    if (position_ == config::Position::Top) {
        strut[2] = height_;
        strut[9] = width_ - 1;
    } else {
        strut[3] = height_;
        strut[11] = width_ - 1;
    }
    Atom strut_partial = XInternAtom(display_, "_NET_WM_STRUT_PARTIAL", False);
    XChangeProperty(display_, window_, strut_partial, XA_CARDINAL, 32, PropModeReplace,
                    reinterpret_cast<unsigned char*>(strut), 12);
    Atom strut_legacy = XInternAtom(display_, "_NET_WM_STRUT", False);
    XChangeProperty(display_, window_, strut_legacy, XA_CARDINAL, 32, PropModeReplace,
                    reinterpret_cast<unsigned char*>(strut), 4);
}

int BarWindow::connection_fd() const {
    return display_ ? ConnectionNumber(display_) : -1;
}

void BarWindow::map() {
    if (!display_ || mapped_) return;
    XMapWindow(display_, window_);
    // Some window managers ignore the initial position of dock windows
    XMoveWindow(display_, window_, 0, y_);
    XFlush(display_);
    mapped_ = true;
    Logger::debug("BarWindow: Mapped");
}

void BarWindow::unmap() {
    if (!display_ || !mapped_) return;
    XUnmapWindow(display_, window_);
    XFlush(display_);
    mapped_ = false;
    Logger::debug("BarWindow: Unmapped");
}

}  // namespace lazybar::x11
