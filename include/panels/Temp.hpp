#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace lazybar::panels {

// Temperature of /sys/class/thermal/thermal_zone<zone>, in degrees Celsius.
class Temp : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    // Millidegrees as read from sysfs to whole degrees
    static std::optional<long> parse_millidegrees(const std::string& text);

private:
    PanelCommon common_;
    long zone_ = 0;
    std::string format_;
    std::chrono::milliseconds interval_{10000};
};

}  // namespace lazybar::panels
