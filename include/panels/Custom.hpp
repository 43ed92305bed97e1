#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace lazybar::panels {

struct CommandResult {
    bool ok = false;
    std::string output;
    std::string error;
};

/**
 * Output of a shell command. Without `interval` the command runs once; with
 * it the command is rerun every `interval` seconds. Commands execute on the
 * worker pool so a slow command never stalls the bar.
 */
class Custom : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    // Runs `sh -c command` and captures stdout, trailing newlines stripped.
    // A non-zero exit status still reports the output but is not ok.
    static CommandResult run_command(const std::string& command);

private:
    PanelCommon common_;
    std::string command_;
    std::string format_;
    std::optional<std::chrono::milliseconds> interval_;
};

}  // namespace lazybar::panels
