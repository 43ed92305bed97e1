#include "bar/Panel.hpp"

namespace lazybar::bar {

const char* alignment_name(Alignment alignment) {
    switch (alignment) {
        case Alignment::Left: return "left";
        case Alignment::Center: return "center";
        case Alignment::Right: return "right";
    }
    return "unknown";
}

}  // namespace lazybar::bar
