#include "panels/Cpu.hpp"
#include "panels/Format.hpp"
#include "panels/PanelStream.hpp"
#include "runtime/Scheduler.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace lazybar::panels {

using util::Logger;

namespace {

class CpuStream : public PanelStream {
public:
    CpuStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
              runtime::Scheduler& scheduler, std::chrono::milliseconds interval, std::string path,
              std::string format, CpuLoad initial)
        : PanelStream(std::move(common), surface, attrs, height),
          interval_(scheduler, interval),
          path_(std::move(path)),
          format_(std::move(format)),
          last_(initial) {}

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker& waker) override {
        auto tick = interval_.poll_next(waker);
        if (tick.is_pending()) return runtime::Poll<bool>::pending();
        if (tick.is_done()) return runtime::Poll<bool>::done();
        return runtime::Poll<bool>::ready(true);
    }

    bar::PanelUpdate render() override {
        auto stat = util::Platform::read_file_trimmed(path_);
        auto load = stat ? Cpu::parse_stat(*stat) : std::nullopt;
        if (!load) {
            return bar::PanelUpdate::error("Failed to read CPU information from " + path_);
        }

        double percentage = Cpu::usage(last_, *load);
        last_ = *load;

        std::ostringstream rounded;
        rounded << std::lround(percentage);
        return draw_text(substitute(format_, {
            {"percentage", rounded.str()},
            {"ramp", common().ramp.choose(percentage, 0.0, 100.0)},
        }));
    }

private:
    runtime::IntervalStream interval_;
    std::string path_;
    std::string format_;
    CpuLoad last_;
};

}  // namespace

PanelConfigPtr Cpu::parse(const std::string& name, const config::Table& table, const config::Config& global) {
    auto cpu = std::make_unique<Cpu>();
    cpu->common_ = PanelCommon::parse(name, table, global);
    cpu->path_ = table.get_string_or("path", "/proc/stat");
    cpu->format_ = PanelCommon::parse_format(table, "", "CPU: %percentage%%");
    if (auto interval = table.get_int("interval")) {
        if (*interval <= 0) throw config::ConfigError("[panels." + name + "] interval must be positive");
        cpu->interval_ = std::chrono::seconds(*interval);
    }
    return cpu;
}

PanelRun Cpu::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                  runtime::Scheduler& scheduler) {
    auto stat = util::Platform::read_file_trimmed(path_);
    auto initial = stat ? parse_stat(*stat) : std::nullopt;
    if (!initial) {
        throw std::runtime_error("Failed to read CPU information from " + path_);
    }
    Logger::debug("Cpu: Initial sample from " + path_);

    PanelRun run;
    run.stream = std::make_unique<CpuStream>(common_, surface, default_attrs, height, scheduler, interval_,
                                             path_, format_, *initial);
    return run;
}

std::optional<CpuLoad> Cpu::parse_stat(const std::string& stat) {
    std::istringstream lines(stat);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string label;
        fields >> label;
        if (label != "cpu") continue;

        std::vector<uint64_t> values;
        uint64_t value = 0;
        while (values.size() < 8 && fields >> value) {
            values.push_back(value);
        }
        if (values.size() < 4) return std::nullopt;
        values.resize(8, 0);

        // iowait counts as idle time
        CpuLoad load;
        load.idle = values[3] + values[4];
        for (auto v : values) load.total += v;
        return load;
    }
    return std::nullopt;
}

double Cpu::usage(const CpuLoad& previous, const CpuLoad& current) {
    if (current.total <= previous.total) return 0.0;
    double total = static_cast<double>(current.total - previous.total);
    double idle = current.idle >= previous.idle ? static_cast<double>(current.idle - previous.idle) : 0.0;
    double busy = total - idle;
    if (busy < 0.0) busy = 0.0;
    return busy / total * 100.0;
}

}  // namespace lazybar::panels
