#pragma once

#include "draw/Color.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace lazybar::draw {

class DrawError : public std::runtime_error {
public:
    explicit DrawError(const std::string& msg) : std::runtime_error(msg) {}
};

struct TextSize {
    int width = 0;
    int height = 0;
};

/**
 * Drawing handle shared by the bar and every panel.
 *
 * Coordinates passed to the primitives are relative to the current origin,
 * which translate() moves and save()/restore() push and pop. Primitives
 * throw DrawError when the backend fails.
 */
class Surface {
public:
    virtual ~Surface() = default;

    void save() { saved_.push_back(origin_); }
    void restore() {
        if (saved_.empty()) throw DrawError("restore() without matching save()");
        origin_ = saved_.back();
        saved_.pop_back();
    }
    void translate(double dx, double dy) {
        origin_.x += dx;
        origin_.y += dy;
    }
    double origin_x() const { return origin_.x; }
    double origin_y() const { return origin_.y; }

    virtual void fill_rect(double x, double y, double width, double height, const Color& color) = 0;
    // y is the top of the text box, not the baseline
    virtual void draw_text(double x, double y, const std::string& text, const std::string& font,
                           const Color& color) = 0;
    virtual TextSize text_size(const std::string& text, const std::string& font) = 0;
    virtual void flush() = 0;

private:
    struct Origin {
        double x = 0.0;
        double y = 0.0;
    };

    Origin origin_;
    std::vector<Origin> saved_;
};

// Restores the origin when the scope ends, including by exception.
class SavedState {
public:
    explicit SavedState(Surface& surface) : surface_(surface) { surface_.save(); }
    ~SavedState() { surface_.restore(); }
    SavedState(const SavedState&) = delete;
    SavedState& operator=(const SavedState&) = delete;

private:
    Surface& surface_;
};

}  // namespace lazybar::draw
