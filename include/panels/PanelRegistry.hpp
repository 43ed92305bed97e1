#pragma once

#include "config/ConfigLoader.hpp"
#include "panels/PanelConfig.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lazybar::panels {

// Maps a panel's `type` to the factory that parses its [panels.<name>] table.
class PanelRegistry {
public:
    using Factory = std::function<PanelConfigPtr(const std::string& name, const config::Table& table,
                                                 const config::Config& global)>;

    static PanelRegistry& instance();

    void register_kind(const std::string& kind, Factory factory);
    bool has_kind(const std::string& kind) const;
    std::vector<std::string> kinds() const;

    // Throws config::ConfigError for a missing section or unknown type.
    PanelConfigPtr create(const std::string& name, const config::Config& global) const;

private:
    PanelRegistry();
    PanelRegistry(const PanelRegistry&) = delete;
    PanelRegistry& operator=(const PanelRegistry&) = delete;

    mutable std::mutex mutex_;
    std::map<std::string, Factory> factories_;
};

}  // namespace lazybar::panels
