#pragma once

#include "bar/Event.hpp"
#include "bar/Panel.hpp"
#include "draw/Attrs.hpp"
#include "draw/Surface.hpp"
#include "runtime/Scheduler.hpp"
#include "runtime/Stream.hpp"
#include <memory>
#include <string>
#include <utility>

namespace lazybar::panels {

struct PanelRun {
    runtime::StreamPtr<bar::PanelUpdate> stream;
    // Null for panels that take no mouse or IPC input
    bar::EventChannel events;
};

/**
 * A configured panel kind. Instances come from the factory registered for
 * their `type` and are started once by the orchestrator.
 */
class PanelConfig {
public:
    virtual ~PanelConfig() = default;

    // (name, initially visible)
    virtual std::pair<std::string, bool> props() const = 0;

    // Acquires the panel's resources and returns its update stream. Runs on
    // a worker thread; throws on failure.
    virtual PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                         runtime::Scheduler& scheduler) = 0;
};

using PanelConfigPtr = std::unique_ptr<PanelConfig>;

}  // namespace lazybar::panels
