#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lazybar::panels {

// Sizes in kB, as /proc/meminfo reports them.
struct MemoryInfo {
    uint64_t total = 0;
    uint64_t available = 0;
    uint64_t swap_total = 0;
    uint64_t swap_free = 0;
};

class Memory : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    // MemAvailable is approximated from MemFree, Buffers, Cached,
    // SReclaimable and Shmem on kernels that lack it.
    static std::optional<MemoryInfo> parse_meminfo(const std::string& meminfo);

    // Values for %{gb,mb}_[swap_]{total,used,free}% and
    // %percentage_[swap_]{used,free}%.
    static std::vector<std::pair<std::string, std::string>> format_values(const MemoryInfo& info);

private:
    PanelCommon common_;
    std::string path_ = "/proc/meminfo";
    std::string format_;
    std::chrono::milliseconds interval_{10000};
};

}  // namespace lazybar::panels
