#include "panels/Storage.hpp"
#include "panels/Format.hpp"
#include "panels/PanelStream.hpp"
#include "runtime/Scheduler.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <stdexcept>
#include <sys/statvfs.h>

namespace lazybar::panels {

namespace {

class StorageStream : public PanelStream {
public:
    StorageStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
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
        auto usage = Storage::query(path_);
        if (!usage) {
            return bar::PanelUpdate::error("Failed to query filesystem at " + path_);
        }

        auto values = Storage::format_values(path_, *usage);
        uint64_t total = usage->used + usage->available;
        double used = total > 0 ? static_cast<double>(usage->used) / static_cast<double>(total) * 100.0 : 0.0;
        values.emplace_back("ramp", common().ramp.choose(used, 0.0, 100.0));
        return draw_text(substitute(format_, values));
    }

private:
    runtime::IntervalStream interval_;
    std::string path_;
    std::string format_;
};

}  // namespace

PanelConfigPtr Storage::parse(const std::string& name, const config::Table& table,
                              const config::Config& global) {
    auto storage = std::make_unique<Storage>();
    storage->common_ = PanelCommon::parse(name, table, global);
    storage->path_ = table.get_string_or("path", "/");
    storage->format_ = PanelCommon::parse_format(table, "", "%path%: %percentage_used%%");
    if (auto interval = table.get_int("interval")) {
        if (*interval <= 0) throw config::ConfigError("[panels." + name + "] interval must be positive");
        storage->interval_ = std::chrono::seconds(*interval);
    }
    return storage;
}

PanelRun Storage::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                      runtime::Scheduler& scheduler) {
    if (!query(path_)) {
        throw std::runtime_error("Cannot stat filesystem at " + path_ + ": " + std::strerror(errno));
    }

    PanelRun run;
    run.stream = std::make_unique<StorageStream>(common_, surface, default_attrs, height, scheduler, interval_,
                                                 path_, format_);
    return run;
}

std::optional<StorageUsage> Storage::query(const std::string& path) {
    struct statvfs info;
    if (::statvfs(path.c_str(), &info) != 0) return std::nullopt;

    StorageUsage usage;
    usage.used = static_cast<uint64_t>(info.f_blocks - info.f_bfree) * info.f_frsize;
    usage.available = static_cast<uint64_t>(info.f_bavail) * info.f_frsize;
    return usage;
}

std::vector<std::pair<std::string, std::string>> Storage::format_values(const std::string& path,
                                                                       const StorageUsage& usage) {
    uint64_t total = usage.used + usage.available;
    uint64_t percentage_used =
        total > 0 ? static_cast<uint64_t>(static_cast<double>(usage.used) / static_cast<double>(total) * 100.0) : 0;

    auto gb = [](uint64_t bytes) {
        return std::format("{:.2f}", static_cast<double>(bytes) / 1024.0 / 1024.0 / 1024.0);
    };
    auto mb = [](uint64_t bytes) { return std::to_string(bytes / 1024 / 1024); };

    return {
        {"path", path},
        {"percentage_used", std::to_string(percentage_used)},
        {"percentage_free", std::to_string(100 - percentage_used)},
        {"gb_total", gb(total)},
        {"gb_used", gb(usage.used)},
        {"gb_free", gb(usage.available)},
        {"mb_total", mb(total)},
        {"mb_used", mb(usage.used)},
        {"mb_free", mb(usage.available)},
    };
}

}  // namespace lazybar::panels
