#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace lazybar::panels {

// First line of a file, redrawn whenever inotify reports a change to it.
class Inotify : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    static std::optional<std::string> read_first_line(const std::filesystem::path& path);

private:
    PanelCommon common_;
    std::filesystem::path path_;
    std::string format_;
};

}  // namespace lazybar::panels
