#pragma once

#include "panels/PanelCommon.hpp"
#include "panels/PanelConfig.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace lazybar::panels {

struct NetworkFormats {
    std::string connected = "%ifname% %essid% %local_ip%";
    std::string disconnected = "%ifname% disconnected";

    std::string render(const std::string& if_name, const std::optional<std::string>& essid,
                       const std::optional<std::string>& address) const;
};

/**
 * Address and wireless ESSID of one interface (`if_name`, default wlan0).
 * An interface without an IPv4 or IPv6 address shows `format_disconnected`;
 * both formats accept %ifname% and %essid%, the connected one %local_ip%.
 */
class Network : public PanelConfig {
public:
    static PanelConfigPtr parse(const std::string& name, const config::Table& table,
                                const config::Config& global);

    std::pair<std::string, bool> props() const override { return {common_.name, common_.visible}; }
    PanelRun run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                 runtime::Scheduler& scheduler) override;

    // First IPv4 address of the interface, else its first IPv6 address.
    static std::optional<std::string> query_address(const std::string& if_name);
    // Empty for wired interfaces and unassociated radios.
    static std::optional<std::string> query_essid(const std::string& if_name);

private:
    PanelCommon common_;
    std::string if_name_ = "wlan0";
    NetworkFormats formats_;
    std::chrono::milliseconds interval_{10000};
};

}  // namespace lazybar::panels
