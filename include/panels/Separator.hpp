#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <string>

namespace lazybar::panels {

// Fixed text, drawn once.
class Separator : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    const std::string& text() const { return text_; }

private:
    PanelCommon common_;
    std::string text_;
};

}  // namespace lazybar::panels
