#include "panels/Battery.hpp"
#include "panels/Format.hpp"
#include "panels/PanelStream.hpp"
#include "runtime/Scheduler.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <charconv>
#include <stdexcept>

namespace lazybar::panels {

using util::Logger;

namespace {

class BatteryStream : public PanelStream {
public:
    BatteryStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
                  runtime::Scheduler& scheduler, std::chrono::milliseconds interval,
                  std::filesystem::path battery_dir, std::filesystem::path adapter_dir,
                  std::optional<int> full_at, BatteryFormats formats)
        : PanelStream(std::move(common), surface, attrs, height),
          interval_(scheduler, interval),
          battery_dir_(std::move(battery_dir)),
          adapter_dir_(std::move(adapter_dir)),
          full_at_(full_at),
          formats_(std::move(formats)) {}

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker& waker) override {
        auto tick = interval_.poll_next(waker);
        if (tick.is_pending()) return runtime::Poll<bool>::pending();
        if (tick.is_done()) return runtime::Poll<bool>::done();
        return runtime::Poll<bool>::ready(true);
    }

    bar::PanelUpdate render() override {
        auto capacity_text = util::Platform::read_file_trimmed(battery_dir_ / "capacity");
        int capacity = 0;
        if (!capacity_text) {
            return bar::PanelUpdate::error("Failed to read " + (battery_dir_ / "capacity").string());
        }
        auto [ptr, ec] = std::from_chars(capacity_text->data(), capacity_text->data() + capacity_text->size(),
                                         capacity);
        if (ec != std::errc()) {
            return bar::PanelUpdate::error("Invalid battery capacity: " + *capacity_text);
        }

        auto status = util::Platform::read_file_trimmed(battery_dir_ / "status").value_or("Unknown");
        auto state = Battery::resolve_state(capacity, status, full_at_);

        // A discharging report while the adapter is online is stale
        if (state == BatteryState::Discharging) {
            auto online = util::Platform::read_file_trimmed(adapter_dir_ / "online");
            if (online && *online == "1") state = BatteryState::NotCharging;
        }

        return draw_text(substitute(formats_.for_state(state), {
            {"percentage", std::to_string(capacity)},
            {"ramp", common().ramp.choose(capacity, 0.0, 100.0)},
        }));
    }

private:
    runtime::IntervalStream interval_;
    std::filesystem::path battery_dir_;
    std::filesystem::path adapter_dir_;
    std::optional<int> full_at_;
    BatteryFormats formats_;
};

}  // namespace

const std::string& BatteryFormats::for_state(BatteryState state) const {
    switch (state) {
        case BatteryState::Charging: return charging;
        case BatteryState::Discharging: return discharging;
        case BatteryState::NotCharging: return not_charging;
        case BatteryState::Full: return full;
        case BatteryState::Unknown: break;
    }
    return unknown;
}

PanelConfigPtr Battery::parse(const std::string& name, const config::Table& table,
                              const config::Config& global) {
    auto battery = std::make_unique<Battery>();
    battery->common_ = PanelCommon::parse(name, table, global);
    battery->path_ = table.get_string_or("path", "/sys/class/power_supply");
    battery->battery_ = table.get_string_or("battery", "BAT0");
    battery->adapter_ = table.get_string_or("adapter", "AC");

    if (auto full_at = table.get_int("full_at")) {
        if (*full_at < 0 || *full_at > 100) {
            throw config::ConfigError("[panels." + name + "] full_at must be between 0 and 100");
        }
        battery->full_at_ = static_cast<int>(*full_at);
    }
    if (auto interval = table.get_int("interval")) {
        if (*interval <= 0) throw config::ConfigError("[panels." + name + "] interval must be positive");
        battery->interval_ = std::chrono::seconds(*interval);
    }

    BatteryFormats defaults;
    auto& formats = battery->formats_;
    formats.charging = PanelCommon::parse_format(table, "charging", defaults.charging);
    formats.discharging = PanelCommon::parse_format(table, "discharging", defaults.discharging);
    formats.not_charging = PanelCommon::parse_format(table, "not_charging", defaults.not_charging);
    formats.full = PanelCommon::parse_format(table, "full", defaults.full);
    formats.unknown = PanelCommon::parse_format(table, "unknown", defaults.unknown);
    return battery;
}

PanelRun Battery::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                      runtime::Scheduler& scheduler) {
    auto battery_dir = path_ / battery_;
    std::error_code ec;
    if (!std::filesystem::exists(battery_dir / "capacity", ec)) {
        throw std::runtime_error("No battery at " + battery_dir.string());
    }
    Logger::info("Battery: Monitoring " + battery_dir.string());

    PanelRun run;
    run.stream = std::make_unique<BatteryStream>(common_, surface, default_attrs, height, scheduler, interval_,
                                                 battery_dir, path_ / adapter_, full_at_, formats_);
    return run;
}

BatteryState Battery::parse_status(const std::string& status) {
    if (status == "Charging") return BatteryState::Charging;
    if (status == "Discharging") return BatteryState::Discharging;
    if (status == "Not charging") return BatteryState::NotCharging;
    if (status == "Full") return BatteryState::Full;
    return BatteryState::Unknown;
}

BatteryState Battery::resolve_state(int capacity, const std::string& status, std::optional<int> full_at) {
    if (full_at && capacity > *full_at) return BatteryState::Full;
    return parse_status(status);
}

}  // namespace lazybar::panels
