#include "panels/PanelRegistry.hpp"
#include "panels/Battery.hpp"
#include "panels/Clock.hpp"
#include "panels/Cpu.hpp"
#include "panels/Custom.hpp"
#include "panels/Inotify.hpp"
#include "panels/Memory.hpp"
#include "panels/Network.hpp"
#include "panels/Separator.hpp"
#include "panels/Storage.hpp"
#include "panels/Temp.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#ifdef LAZYBAR_HAVE_PIPEWIRE
#include "panels/Volume.hpp"
#endif

namespace lazybar::panels {

PanelRegistry& PanelRegistry::instance() {
    static PanelRegistry registry;
    return registry;
}

PanelRegistry::PanelRegistry() {
    factories_["battery"] = &Battery::parse;
    factories_["clock"] = &Clock::parse;
    factories_["cpu"] = &Cpu::parse;
    factories_["custom"] = &Custom::parse;
    factories_["inotify"] = &Inotify::parse;
    factories_["memory"] = &Memory::parse;
    factories_["network"] = &Network::parse;
    factories_["separator"] = &Separator::parse;
    factories_["storage"] = &Storage::parse;
    factories_["temp"] = &Temp::parse;
#ifdef LAZYBAR_HAVE_PIPEWIRE
    factories_["volume"] = &Volume::parse;
#endif
}

void PanelRegistry::register_kind(const std::string& kind, Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[kind] = std::move(factory);
}

bool PanelRegistry::has_kind(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(kind) > 0;
}

std::vector<std::string> PanelRegistry::kinds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [kind, factory] : factories_) result.push_back(kind);
    return result;
}

PanelConfigPtr PanelRegistry::create(const std::string& name, const config::Config& global) const {
    const auto* table = global.section("panels." + name);
    if (!table) {
        throw config::ConfigError("No panel named " + name + " ([panels." + name + "]) in config");
    }

    auto kind = table->get_string("type");
    if (!kind) {
        throw config::ConfigError("[panels." + name + "] is missing its type");
    }
    std::string folded = util::fold_case(*kind);

    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(folded);
        if (it == factories_.end()) {
            throw config::ConfigError("[panels." + name + "] unknown panel type " + *kind);
        }
        factory = it->second;
    }

    util::Logger::debug("PanelRegistry: Creating " + folded + " panel " + name);
    return factory(name, *table, global);
}

}  // namespace lazybar::panels
