#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <chrono>
#include <ctime>
#include <string>
#include <vector>

namespace lazybar::panels {

/**
 * Local time rendered through strftime. `format`, `format_1`, `format_2`...
 * are cycled with the `cycle` and `cycle_back` actions. The panel redraws on
 * every `precision` boundary (seconds, minutes, hours or days).
 */
class Clock : public PanelConfig {
public:
    enum class Precision { Seconds, Minutes, Hours, Days };

    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    static std::string format_time(const std::string& format, std::time_t when);
    // Time left until the next boundary of the given unit
    static std::chrono::milliseconds until_next_tick(Precision precision, std::time_t now);

    const std::vector<std::string>& formats() const { return formats_; }

private:
    PanelCommon common_;
    std::vector<std::string> formats_;
    Precision precision_ = Precision::Seconds;
};

}  // namespace lazybar::panels
