#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace lazybar::panels {

enum class BatteryState { Charging, Discharging, NotCharging, Full, Unknown };

struct BatteryFormats {
    std::string charging = "CHG: %percentage%%";
    std::string discharging = "DSCHG: %percentage%%";
    std::string not_charging = "NCHG: %percentage%%";
    std::string full = "FULL: %percentage%%";
    std::string unknown = "%percentage%%";

    const std::string& for_state(BatteryState state) const;
};

/**
 * Charge level and state of one power supply under `path`
 * (default /sys/class/power_supply). When `full_at` is set, any capacity
 * above it is shown with the full format regardless of the status file.
 */
class Battery : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    // Maps the kernel's status strings; anything unrecognized is Unknown.
    static BatteryState parse_status(const std::string& status);

    static BatteryState resolve_state(int capacity, const std::string& status, std::optional<int> full_at);

private:
    PanelCommon common_;
    std::filesystem::path path_ = "/sys/class/power_supply";
    std::string battery_ = "BAT0";
    std::string adapter_ = "AC";
    std::optional<int> full_at_;
    BatteryFormats formats_;
    std::chrono::milliseconds interval_{10000};
};

}  // namespace lazybar::panels
