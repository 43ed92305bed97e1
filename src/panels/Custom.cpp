#include "panels/Custom.hpp"
#include "panels/Format.hpp"
#include "panels/PanelStream.hpp"
#include "runtime/Channel.hpp"
#include "runtime/Scheduler.hpp"
#include "runtime/WorkerPool.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <sys/wait.h>

namespace lazybar::panels {

using util::Logger;

namespace {

class CustomStream : public PanelStream {
public:
    CustomStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
                 runtime::Scheduler& scheduler, std::optional<std::chrono::milliseconds> interval,
                 std::string command, std::string format)
        : PanelStream(std::move(common), surface, attrs, height),
          command_(std::move(command)),
          format_(std::move(format)),
          results_(runtime::Channel<CommandResult>::create()) {
        if (interval) {
            interval_ = std::make_unique<runtime::IntervalStream>(scheduler, *interval);
        }
    }

    ~CustomStream() override { results_->close(); }

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker& waker) override {
        auto result = results_->poll_next(waker);
        if (result.is_ready()) {
            in_flight_ = false;
            last_ = result.take();
            return runtime::Poll<bool>::ready(true);
        }

        if (in_flight_) return runtime::Poll<bool>::pending();

        if (interval_) {
            auto tick = interval_->poll_next(waker);
            if (tick.is_pending()) return runtime::Poll<bool>::pending();
        } else if (started_) {
            return runtime::Poll<bool>::done();
        }

        launch();
        // The result channel is polled again straight away and stores the waker
        return runtime::Poll<bool>::ready(false);
    }

    bar::PanelUpdate render() override {
        if (!last_.ok && last_.output.empty()) {
            return bar::PanelUpdate::error(last_.error);
        }
        return draw_text(substitute(format_, {{"stdout", last_.output}}));
    }

private:
    void launch() {
        started_ = true;
        in_flight_ = true;

        auto results = results_;
        auto command = command_;
        auto name = common().name;
        bool submitted = runtime::WorkerPool::instance().submit_job([results, command, name]() {
            auto result = Custom::run_command(command);
            if (!result.ok) {
                Logger::warn("Custom: " + name + ": " + result.error);
            }
            results->send(std::move(result));
        });

        if (!submitted) {
            in_flight_ = false;
            Logger::warn("Custom: Worker queue full, skipping run of " + name);
        }
    }

    std::string command_;
    std::string format_;
    std::unique_ptr<runtime::IntervalStream> interval_;
    std::shared_ptr<runtime::Channel<CommandResult>> results_;
    CommandResult last_;
    bool started_ = false;
    bool in_flight_ = false;
};

}  // namespace

PanelConfigPtr Custom::parse(const std::string& name, const config::Table& table, const config::Config& global) {
    auto custom = std::make_unique<Custom>();
    custom->common_ = PanelCommon::parse(name, table, global);

    auto command = table.get_string("command");
    if (!command || command->empty()) {
        throw config::ConfigError("[panels." + name + "] custom panels need a command");
    }
    custom->command_ = *command;
    custom->format_ = PanelCommon::parse_format(table, "", "%stdout%");

    if (auto interval = table.get_int("interval")) {
        if (*interval <= 0) throw config::ConfigError("[panels." + name + "] interval must be positive");
        custom->interval_ = std::chrono::seconds(*interval);
    }
    return custom;
}

PanelRun Custom::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                     runtime::Scheduler& scheduler) {
    PanelRun run;
    run.stream = std::make_unique<CustomStream>(common_, surface, default_attrs, height, scheduler, interval_,
                                                command_, format_);
    return run;
}

CommandResult Custom::run_command(const std::string& command) {
    CommandResult result;

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        result.error = "Failed to run " + command + ": " + std::strerror(errno);
        return result;
    }

    char buffer[512];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        result.output += buffer;
    }
    while (!result.output.empty() && (result.output.back() == '\n' || result.output.back() == '\r')) {
        result.output.pop_back();
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.error = "Failed to wait for " + command + ": " + std::strerror(errno);
    } else if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        result.ok = true;
    } else if (WIFEXITED(status)) {
        result.error = command + " exited with status " + std::to_string(WEXITSTATUS(status));
    } else {
        result.error = command + " terminated abnormally";
    }
    return result;
}

}  // namespace lazybar::panels
