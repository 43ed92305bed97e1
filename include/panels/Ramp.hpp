#pragma once

#include "config/ConfigLoader.hpp"
#include <string>
#include <vector>

namespace lazybar::panels {

// Ordered icons picked by where a value falls in [min, max].
class Ramp {
public:
    Ramp() = default;
    explicit Ramp(std::vector<std::string> icons) : icons_(std::move(icons)) {}

    // Reads [ramps.<name>] with keys 0..n-1. Throws config::ConfigError.
    static Ramp parse(const config::Config& config, const std::string& name);

    bool empty() const { return icons_.empty(); }
    size_t size() const { return icons_.size(); }

    std::string choose(double value, double min, double max) const;

private:
    std::vector<std::string> icons_;
};

}  // namespace lazybar::panels
