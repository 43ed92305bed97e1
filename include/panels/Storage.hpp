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

// Sizes in bytes. Reserved blocks count as neither used nor free.
struct StorageUsage {
    uint64_t used = 0;
    uint64_t available = 0;
};

// Disk usage of the filesystem holding `path`, read with statvfs(3).
class Storage : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    static std::optional<StorageUsage> query(const std::string& path);

    // Values for %path%, %{gb,mb}_{total,used,free}% and %percentage_{used,free}%.
    static std::vector<std::pair<std::string, std::string>> format_values(const std::string& path,
                                                                          const StorageUsage& usage);

private:
    PanelCommon common_;
    std::string path_ = "/";
    std::string format_;
    std::chrono::milliseconds interval_{10000};
};

}  // namespace lazybar::panels
