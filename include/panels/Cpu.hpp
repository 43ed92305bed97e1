#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lazybar::panels {

struct CpuLoad {
    uint64_t idle = 0;
    uint64_t total = 0;
};

// Aggregate CPU usage from /proc/stat, averaged over each interval.
class Cpu : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    // Reads the aggregate "cpu" line: user nice system idle iowait irq softirq steal.
    static std::optional<CpuLoad> parse_stat(const std::string& stat);
    // Busy share of the time between two samples, in percent.
    static double usage(const CpuLoad& previous, const CpuLoad& current);

private:
    PanelCommon common_;
    std::string path_ = "/proc/stat";
    std::string format_;
    std::chrono::milliseconds interval_{10000};
};

}  // namespace lazybar::panels
