#include "panels/Ramp.hpp"
#include <algorithm>
#include <cmath>

namespace lazybar::panels {

Ramp Ramp::parse(const config::Config& config, const std::string& name) {
    const auto* table = config.section("ramps." + name);
    if (!table) {
        throw config::ConfigError("No ramp named " + name + " ([ramps." + name + "]) in config");
    }

    std::vector<std::string> icons;
    for (size_t i = 0;; ++i) {
        auto icon = table->get_string(std::to_string(i));
        if (!icon) break;
        icons.push_back(*icon);
    }
    if (icons.empty()) {
        throw config::ConfigError("[ramps." + name + "] needs at least the key 0");
    }
    return Ramp(std::move(icons));
}

std::string Ramp::choose(double value, double min, double max) const {
    if (icons_.empty()) return "";
    if (max <= min) return icons_.back();

    double fraction = (value - min) / (max - min);
    auto idx = static_cast<long>(std::floor(fraction * static_cast<double>(icons_.size())));
    idx = std::clamp(idx, 0L, static_cast<long>(icons_.size()) - 1);
    return icons_[static_cast<size_t>(idx)];
}

}  // namespace lazybar::panels
