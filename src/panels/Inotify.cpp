#include "panels/Inotify.hpp"
#include "panels/Format.hpp"
#include "panels/PanelStream.hpp"
#include "runtime/Channel.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <poll.h>
#include <stdexcept>
#include <stop_token>
#include <sys/inotify.h>
#include <thread>
#include <unistd.h>

namespace lazybar::panels {

using util::Logger;

namespace {

// Owns the inotify descriptor and the thread blocked on it.
class FileWatcher {
public:
    FileWatcher(const std::filesystem::path& path, std::shared_ptr<runtime::Channel<bool>> changes)
        : changes_(std::move(changes)) {
        fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (fd_ < 0) {
            throw std::runtime_error(std::string("inotify_init1 failed: ") + std::strerror(errno));
        }
        if (inotify_add_watch(fd_, path.c_str(), IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB) < 0) {
            int err = errno;
            close(fd_);
            throw std::runtime_error("Failed to watch " + path.string() + ": " + std::strerror(err));
        }

        thread_ = std::jthread([this](std::stop_token stop_token) { watch(stop_token); });
    }

    ~FileWatcher() {
        thread_.request_stop();
        if (thread_.joinable()) thread_.join();
        close(fd_);
    }

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

private:
    void watch(std::stop_token stop_token) {
        alignas(inotify_event) char buffer[4096];
        while (!stop_token.stop_requested()) {
            pollfd pfd{fd_, POLLIN, 0};
            // Short timeout so a stop request is noticed promptly
            int ready = ::poll(&pfd, 1, 200);
            if (ready < 0) {
                if (errno == EINTR) continue;
                Logger::error(std::string("Inotify: poll failed: ") + std::strerror(errno));
                break;
            }
            if (ready == 0) continue;

            ssize_t len = read(fd_, buffer, sizeof(buffer));
            if (len > 0 && !changes_->send(true)) break;
        }
        changes_->close();
    }

    int fd_ = -1;
    std::shared_ptr<runtime::Channel<bool>> changes_;
    std::jthread thread_;
};

class InotifyStream : public PanelStream {
public:
    InotifyStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
                  std::filesystem::path path, std::string format)
        : PanelStream(std::move(common), surface, attrs, height),
          path_(std::move(path)),
          format_(std::move(format)),
          changes_(runtime::Channel<bool>::create()),
          watcher_(std::make_unique<FileWatcher>(path_, changes_)) {}

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker& waker) override {
        if (!drawn_) {
            drawn_ = true;
            return runtime::Poll<bool>::ready(true);
        }

        auto change = changes_->poll_next(waker);
        if (change.is_pending()) return runtime::Poll<bool>::pending();
        if (change.is_done()) return runtime::Poll<bool>::done();

        // Coalesce a burst of writes into one redraw
        while (changes_->try_receive()) {
        }
        return runtime::Poll<bool>::ready(true);
    }

    bar::PanelUpdate render() override {
        auto line = Inotify::read_first_line(path_);
        if (!line) {
            return bar::PanelUpdate::error("Failed to read " + path_.string());
        }
        return draw_text(substitute(format_, {{"file", *line}}));
    }

private:
    std::filesystem::path path_;
    std::string format_;
    std::shared_ptr<runtime::Channel<bool>> changes_;
    std::unique_ptr<FileWatcher> watcher_;
    bool drawn_ = false;
};

}  // namespace

PanelConfigPtr Inotify::parse(const std::string& name, const config::Table& table,
                              const config::Config& global) {
    auto inotify = std::make_unique<Inotify>();
    inotify->common_ = PanelCommon::parse(name, table, global);

    auto path = table.get_string("path");
    if (!path || path->empty()) {
        throw config::ConfigError("[panels." + name + "] inotify panels need a path");
    }
    inotify->path_ = *path;
    inotify->format_ = PanelCommon::parse_format(table, "", "%file%");
    return inotify;
}

PanelRun Inotify::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                      runtime::Scheduler&) {
    PanelRun run;
    run.stream = std::make_unique<InotifyStream>(common_, surface, default_attrs, height, path_, format_);
    Logger::info("Inotify: Watching " + path_.string());
    return run;
}

std::optional<std::string> Inotify::read_first_line(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;

    std::string line;
    std::getline(file, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

}  // namespace lazybar::panels
