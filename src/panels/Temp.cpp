#include "panels/Temp.hpp"
#include "panels/Format.hpp"
#include "panels/PanelStream.hpp"
#include "runtime/Scheduler.hpp"
#include "util/Platform.hpp"
#include <charconv>
#include <filesystem>
#include <stdexcept>

namespace lazybar::panels {

namespace {

class TempStream : public PanelStream {
public:
    TempStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
               runtime::Scheduler& scheduler, std::chrono::milliseconds interval, std::filesystem::path path,
               std::string format)
        : PanelStream(std::move(common), surface, attrs, height),
          interval_(scheduler, interval),
          path_(std::move(path)),
          format_(std::move(format)) {}

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker& waker) override {
        auto tick = interval_.poll_next(waker);
        if (tick.is_pending()) return runtime::Poll<bool>::pending();
        if (tick.is_done()) return runtime::Poll<bool>::done();
        return runtime::Poll<bool>::ready(true);
    }

    bar::PanelUpdate render() override {
        auto text = util::Platform::read_file_trimmed(path_);
        auto degrees = text ? Temp::parse_millidegrees(*text) : std::nullopt;
        if (!degrees) {
            return bar::PanelUpdate::error("Failed to read temperature from " + path_.string());
        }
        return draw_text(substitute(format_, {
            {"temp", std::to_string(*degrees)},
            {"ramp", common().ramp.choose(static_cast<double>(*degrees), 0.0, 200.0)},
        }));
    }

private:
    runtime::IntervalStream interval_;
    std::filesystem::path path_;
    std::string format_;
};

}  // namespace

PanelConfigPtr Temp::parse(const std::string& name, const config::Table& table, const config::Config& global) {
    auto temp = std::make_unique<Temp>();
    temp->common_ = PanelCommon::parse(name, table, global);
    temp->format_ = PanelCommon::parse_format(table, "", "TEMP: %temp%");
    temp->zone_ = table.get_int("zone").value_or(0);
    if (temp->zone_ < 0) {
        throw config::ConfigError("[panels." + name + "] zone must not be negative");
    }
    if (auto interval = table.get_int("interval")) {
        if (*interval <= 0) throw config::ConfigError("[panels." + name + "] interval must be positive");
        temp->interval_ = std::chrono::seconds(*interval);
    }
    return temp;
}

PanelRun Temp::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                   runtime::Scheduler& scheduler) {
    std::filesystem::path path = "/sys/class/thermal/thermal_zone" + std::to_string(zone_) + "/temp";
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw std::runtime_error("No thermal zone at " + path.string());
    }

    PanelRun run;
    run.stream = std::make_unique<TempStream>(common_, surface, default_attrs, height, scheduler, interval_, path,
                                              format_);
    return run;
}

std::optional<long> Temp::parse_millidegrees(const std::string& text) {
    long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr == text.data()) return std::nullopt;
    return value / 1000;
}

}  // namespace lazybar::panels
