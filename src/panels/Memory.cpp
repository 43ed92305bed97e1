#include "panels/Memory.hpp"
#include "panels/Format.hpp"
#include "panels/PanelStream.hpp"
#include "runtime/Scheduler.hpp"
#include "util/Platform.hpp"
#include <format>
#include <map>
#include <sstream>

namespace lazybar::panels {

namespace {

class MemoryStream : public PanelStream {
public:
    MemoryStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
                 runtime::Scheduler& scheduler, std::chrono::milliseconds interval, std::string path,
                 std::string format)
        : PanelStream(std::move(common), surface, attrs, height),
          interval_(scheduler, interval),
          path_(std::move(path)),
          format_(std::move(format)) {}

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker& waker) override {
        auto tick = interval_.poll_next(waker);
        if (tick.is_pending()) return runtime::Poll<bool>::pending();
        if (tick.is_done()) return runtime::Poll<bool>::done();
        return runtime::Poll<bool>::ready(true);
    }

    bar::PanelUpdate render() override {
        auto text = util::Platform::read_file_trimmed(path_);
        auto info = text ? Memory::parse_meminfo(*text) : std::nullopt;
        if (!info) {
            return bar::PanelUpdate::error("Failed to read memory information from " + path_);
        }

        auto values = Memory::format_values(*info);
        double used = info->total > 0
            ? static_cast<double>(info->total - info->available) / static_cast<double>(info->total) * 100.0
            : 0.0;
        values.emplace_back("ramp", common().ramp.choose(used, 0.0, 100.0));
        return draw_text(substitute(format_, values));
    }

private:
    runtime::IntervalStream interval_;
    std::string path_;
    std::string format_;
};

uint64_t percent_of(uint64_t part, uint64_t whole) {
    if (whole == 0) return 0;
    return static_cast<uint64_t>(static_cast<double>(part) / static_cast<double>(whole) * 100.0);
}

}  // namespace

PanelConfigPtr Memory::parse(const std::string& name, const config::Table& table,
                             const config::Config& global) {
    auto memory = std::make_unique<Memory>();
    memory->common_ = PanelCommon::parse(name, table, global);
    memory->path_ = table.get_string_or("path", "/proc/meminfo");
    memory->format_ = PanelCommon::parse_format(table, "", "RAM: %percentage_used%%");
    if (auto interval = table.get_int("interval")) {
        if (*interval <= 0) throw config::ConfigError("[panels." + name + "] interval must be positive");
        memory->interval_ = std::chrono::seconds(*interval);
    }
    return memory;
}

PanelRun Memory::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                     runtime::Scheduler& scheduler) {
    PanelRun run;
    run.stream = std::make_unique<MemoryStream>(common_, surface, default_attrs, height, scheduler, interval_,
                                                path_, format_);
    return run;
}

std::optional<MemoryInfo> Memory::parse_meminfo(const std::string& meminfo) {
    std::map<std::string, uint64_t> fields;
    std::istringstream lines(meminfo);
    std::string line;
    while (std::getline(lines, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::istringstream rest(line.substr(colon + 1));
        uint64_t value = 0;
        if (rest >> value) {
            fields[line.substr(0, colon)] = value;
        }
    }

    auto get = [&fields](const char* key) -> std::optional<uint64_t> {
        auto it = fields.find(key);
        if (it == fields.end()) return std::nullopt;
        return it->second;
    };

    auto total = get("MemTotal");
    if (!total) return std::nullopt;

    MemoryInfo info;
    info.total = *total;
    if (auto available = get("MemAvailable")) {
        info.available = *available;
    } else {
        auto free = get("MemFree");
        auto buffers = get("Buffers");
        auto cached = get("Cached");
        auto reclaimable = get("SReclaimable");
        auto shmem = get("Shmem");
        if (!free || !buffers || !cached || !reclaimable || !shmem) return std::nullopt;
        uint64_t sum = *free + *buffers + *cached + *reclaimable;
        info.available = sum > *shmem ? sum - *shmem : 0;
    }
    if (info.available > info.total) info.available = info.total;

    info.swap_total = get("SwapTotal").value_or(0);
    info.swap_free = get("SwapFree").value_or(0);
    if (info.swap_free > info.swap_total) info.swap_free = info.swap_total;
    return info;
}

std::vector<std::pair<std::string, std::string>> Memory::format_values(const MemoryInfo& info) {
    uint64_t used = info.total - info.available;
    uint64_t swap_used = info.swap_total - info.swap_free;

    auto gb = [](uint64_t kb) { return std::format("{:.2f}", static_cast<double>(kb) / 1024.0 / 1024.0); };
    auto mb = [](uint64_t kb) { return std::format("{:.0f}", static_cast<double>(kb) / 1024.0); };

    uint64_t percentage_used = percent_of(used, info.total);
    uint64_t percentage_swap_used = percent_of(swap_used, info.swap_total);

    return {
        {"percentage_swap_used", std::to_string(percentage_swap_used)},
        {"percentage_swap_free", std::to_string(info.swap_total ? 100 - percentage_swap_used : 0)},
        {"percentage_used", std::to_string(percentage_used)},
        {"percentage_free", std::to_string(100 - percentage_used)},
        {"gb_swap_total", gb(info.swap_total)},
        {"gb_swap_used", gb(swap_used)},
        {"gb_swap_free", gb(info.swap_free)},
        {"mb_swap_total", mb(info.swap_total)},
        {"mb_swap_used", mb(swap_used)},
        {"mb_swap_free", mb(info.swap_free)},
        {"gb_total", gb(info.total)},
        {"gb_used", gb(used)},
        {"gb_free", gb(info.available)},
        {"mb_total", mb(info.total)},
        {"mb_used", mb(used)},
        {"mb_free", mb(info.available)},
    };
}

}  // namespace lazybar::panels
