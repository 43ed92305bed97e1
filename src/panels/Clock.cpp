#include "panels/Clock.hpp"
#include "panels/PanelStream.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>

namespace lazybar::panels {

using util::Logger;

namespace {

class ClockStream : public PanelStream {
public:
    ClockStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
                bar::EventChannel events, runtime::Scheduler& scheduler, std::vector<std::string> formats,
                Clock::Precision precision)
        : PanelStream(std::move(common), surface, attrs, height, std::move(events)),
          scheduler_(scheduler),
          formats_(std::move(formats)),
          precision_(precision) {}

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker& waker) override {
        auto now = runtime::Scheduler::Clock::now();
        if (armed_ && now < deadline_) {
            return runtime::Poll<bool>::pending();
        }
        // Tick once on start, then at each boundary
        deadline_ = now + Clock::until_next_tick(precision_, std::time(nullptr));
        scheduler_.wake_at(deadline_, waker);
        armed_ = true;
        return runtime::Poll<bool>::ready(true);
    }

    bar::PanelUpdate render() override {
        return draw_text(Clock::format_time(formats_[index_], std::time(nullptr)));
    }

    bar::EventResponse handle_action(const std::string& action, bool& redraw) override {
        if (action == "cycle") {
            index_ = (index_ + 1) % formats_.size();
        } else if (action == "cycle_back") {
            index_ = (index_ + formats_.size() - 1) % formats_.size();
        } else {
            redraw = false;
            return bar::EventResponse::failure("Unknown event " + action);
        }
        redraw = true;
        return bar::EventResponse::success();
    }

private:
    runtime::Scheduler& scheduler_;
    std::vector<std::string> formats_;
    Clock::Precision precision_;
    size_t index_ = 0;
    runtime::Scheduler::Clock::time_point deadline_;
    bool armed_ = false;
};

}  // namespace

PanelConfigPtr Clock::parse(const std::string& name, const config::Table& table, const config::Config& global) {
    auto clock = std::make_unique<Clock>();
    clock->common_ = PanelCommon::parse(name, table, global);

    clock->formats_.push_back(PanelCommon::parse_format(table, "", "%Y-%m-%d %T"));
    for (int i = 1;; i++) {
        auto key = std::to_string(i);
        if (!table.contains("format_" + key)) break;
        clock->formats_.push_back(PanelCommon::parse_format(table, key, ""));
    }

    auto precision = util::fold_case(table.get_string_or("precision", "seconds"));
    if (precision == "seconds") {
        clock->precision_ = Precision::Seconds;
    } else if (precision == "minutes") {
        clock->precision_ = Precision::Minutes;
    } else if (precision == "hours") {
        clock->precision_ = Precision::Hours;
    } else if (precision == "days") {
        clock->precision_ = Precision::Days;
    } else {
        throw config::ConfigError("[panels." + name + "] precision: expected seconds, minutes, hours or days");
    }

    Logger::debug("Clock: " + name + " has " + std::to_string(clock->formats_.size()) + " formats");
    return clock;
}

PanelRun Clock::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                    runtime::Scheduler& scheduler) {
    auto events = runtime::Channel<bar::Event>::create();
    PanelRun run;
    run.events = events;
    run.stream = std::make_unique<ClockStream>(common_, surface, default_attrs, height, events, scheduler,
                                               formats_, precision_);
    return run;
}

std::string Clock::format_time(const std::string& format, std::time_t when) {
    if (format.empty()) return {};

    std::tm local{};
    localtime_r(&when, &local);

    std::vector<char> buffer(128);
    while (buffer.size() <= 4096) {
        size_t written = std::strftime(buffer.data(), buffer.size(), format.c_str(), &local);
        if (written > 0) return std::string(buffer.data(), written);
        buffer.resize(buffer.size() * 2);
    }
    // strftime also returns 0 for formats that legitimately expand to nothing
    return {};
}

std::chrono::milliseconds Clock::until_next_tick(Precision precision, std::time_t now) {
    std::tm local{};
    localtime_r(&now, &local);

    long seconds = 1;
    switch (precision) {
        case Precision::Seconds: {
            auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;
            return std::chrono::milliseconds(1000 - ms);
        }
        case Precision::Minutes:
            seconds = 60 - local.tm_sec;
            break;
        case Precision::Hours:
            seconds = 60L * (59 - local.tm_min) + (60 - local.tm_sec);
            break;
        case Precision::Days:
            seconds = 3600L * (23 - local.tm_hour) + 60L * (59 - local.tm_min) + (60 - local.tm_sec);
            break;
    }
    return std::chrono::seconds(std::max(seconds, 1L));
}

}  // namespace lazybar::panels
