#pragma once

#include "bar/Panel.hpp"
#include "draw/Attrs.hpp"
#include "draw/Surface.hpp"
#include "panels/PanelConfig.hpp"
#include "runtime/Scheduler.hpp"
#include "runtime/StreamMap.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lazybar::runtime {

using IndexedUpdate = std::pair<size_t, bar::PanelUpdate>;
// Outer map keyed by alignment, each holding the alignment's panels keyed by index
using PanelStreams = StreamMap<bar::Alignment, IndexedUpdate>;

struct BringUpResult {
    std::vector<bar::Panel> left;
    std::vector<bar::Panel> center;
    std::vector<bar::Panel> right;
    std::unique_ptr<PanelStreams> streams;
    size_t failed = 0;

    std::vector<bar::Panel>& panels(bar::Alignment alignment);
};

/**
 * Starts every configured panel concurrently on the worker pool and
 * assembles the panel arrays and the update stream group once all setups
 * have finished. Setups that throw are logged and their panel is left out;
 * survivors keep their configured relative order.
 */
class Orchestrator {
public:
    Orchestrator(draw::Surface& surface, draw::Attrs default_attrs, int height, Scheduler& scheduler);

    void add(bar::Alignment alignment, panels::PanelConfigPtr config);
    size_t size() const { return configs_.size(); }

    // Blocks until every setup has completed. Callable once.
    BringUpResult start();

private:
    struct Entry {
        bar::Alignment alignment;
        size_t index;
        panels::PanelConfigPtr config;
    };

    struct SetupResult {
        bar::Alignment alignment = bar::Alignment::Left;
        size_t index = 0;
        std::string name;
        bool visible = true;
        bool ok = false;
        std::string error;
        panels::PanelRun run;
    };

    SetupResult setup(Entry& entry);

    draw::Surface& surface_;
    draw::Attrs default_attrs_;
    int height_;
    Scheduler& scheduler_;
    std::vector<Entry> configs_;
    size_t counts_[3] = {0, 0, 0};
    bool started_ = false;
};

std::string format_panel_error(bar::Alignment alignment, size_t index, const std::string& message);

}  // namespace lazybar::runtime
