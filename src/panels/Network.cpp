#include "panels/Network.hpp"
#include "panels/Format.hpp"
#include "panels/PanelStream.hpp"
#include "runtime/Scheduler.hpp"
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <linux/wireless.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>

namespace lazybar::panels {

namespace {

class NetworkStream : public PanelStream {
public:
    NetworkStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
                  runtime::Scheduler& scheduler, std::chrono::milliseconds interval, std::string if_name,
                  NetworkFormats formats)
        : PanelStream(std::move(common), surface, attrs, height),
          interval_(scheduler, interval),
          if_name_(std::move(if_name)),
          formats_(std::move(formats)) {}

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker& waker) override {
        auto tick = interval_.poll_next(waker);
        if (tick.is_pending()) return runtime::Poll<bool>::pending();
        if (tick.is_done()) return runtime::Poll<bool>::done();
        return runtime::Poll<bool>::ready(true);
    }

    bar::PanelUpdate render() override {
        return draw_text(formats_.render(if_name_, Network::query_essid(if_name_), Network::query_address(if_name_)));
    }

private:
    runtime::IntervalStream interval_;
    std::string if_name_;
    NetworkFormats formats_;
};

}  // namespace

PanelConfigPtr Network::parse(const std::string& name, const config::Table& table,
                              const config::Config& global) {
    auto network = std::make_unique<Network>();
    network->common_ = PanelCommon::parse(name, table, global);
    network->if_name_ = table.get_string_or("if_name", "wlan0");
    if (network->if_name_.empty() || network->if_name_.size() >= IFNAMSIZ) {
        throw config::ConfigError("[panels." + name + "] if_name must be 1 to " + std::to_string(IFNAMSIZ - 1) +
                                  " characters");
    }
    NetworkFormats defaults;
    network->formats_.connected = PanelCommon::parse_format(table, "connected", defaults.connected);
    network->formats_.disconnected = PanelCommon::parse_format(table, "disconnected", defaults.disconnected);
    if (auto interval = table.get_int("interval")) {
        if (*interval <= 0) throw config::ConfigError("[panels." + name + "] interval must be positive");
        network->interval_ = std::chrono::seconds(*interval);
    }
    return network;
}

PanelRun Network::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                      runtime::Scheduler& scheduler) {
    PanelRun run;
    run.stream = std::make_unique<NetworkStream>(common_, surface, default_attrs, height, scheduler, interval_,
                                                 if_name_, formats_);
    return run;
}

std::string NetworkFormats::render(const std::string& if_name, const std::optional<std::string>& essid,
                                   const std::optional<std::string>& address) const {
    std::string ssid = essid.value_or("");
    if (!address) {
        return substitute(disconnected, {{"ifname", if_name}, {"essid", ssid}});
    }
    return substitute(connected, {{"ifname", if_name}, {"essid", ssid}, {"local_ip", *address}});
}

std::optional<std::string> Network::query_address(const std::string& if_name) {
    ifaddrs* addresses = nullptr;
    if (::getifaddrs(&addresses) != 0) return std::nullopt;

    std::optional<std::string> ipv4;
    std::optional<std::string> ipv6;
    char buffer[INET6_ADDRSTRLEN];
    for (ifaddrs* entry = addresses; entry; entry = entry->ifa_next) {
        if (!entry->ifa_addr || if_name != entry->ifa_name) continue;

        int family = entry->ifa_addr->sa_family;
        if (family == AF_INET && !ipv4) {
            auto* in = reinterpret_cast<sockaddr_in*>(entry->ifa_addr);
            if (::inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer))) ipv4 = buffer;
        } else if (family == AF_INET6 && !ipv6) {
            auto* in6 = reinterpret_cast<sockaddr_in6*>(entry->ifa_addr);
            if (::inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer))) ipv6 = buffer;
        }
    }
    ::freeifaddrs(addresses);

    return ipv4 ? ipv4 : ipv6;
}

std::optional<std::string> Network::query_essid(const std::string& if_name) {
    if (if_name.size() >= IFNAMSIZ) return std::nullopt;

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return std::nullopt;

    char essid[IW_ESSID_MAX_SIZE + 1] = {0};
    iwreq request{};
    std::memcpy(request.ifr_ifrn.ifrn_name, if_name.c_str(), if_name.size());
    request.u.essid.pointer = essid;
    request.u.essid.length = sizeof(essid);

    int result = ::ioctl(fd, SIOCGIWESSID, &request);
    ::close(fd);
    if (result < 0) return std::nullopt;
    return std::string(essid);
}

}  // namespace lazybar::panels
