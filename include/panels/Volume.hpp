#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <string>

namespace lazybar::panels {

/**
 * Volume and mute state of a PipeWire sink, by default the first
 * Audio/Sink node announced by the registry. Accepts the `toggle_mute`,
 * `increment` and `decrement` actions; `step` sets the increment in percent.
 */
class Volume : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    // PipeWire channel volumes are linear; mixers show their cube root.
    static int linear_to_percent(float linear);
    static float percent_to_linear(int percent);

private:
    PanelCommon common_;
    std::string sink_;
    std::string format_;
    std::string format_muted_;
    int step_ = 5;
};

}  // namespace lazybar::panels
