#include "bar/Bar.hpp"
#include "bar/EventRouter.hpp"
#include "config/ConfigLoader.hpp"
#include "ipc/IpcServer.hpp"
#include "panels/PanelRegistry.hpp"
#include "runtime/LoopWaker.hpp"
#include "runtime/Orchestrator.hpp"
#include "runtime/Scheduler.hpp"
#include "runtime/Shutdown.hpp"
#include "runtime/WorkerPool.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "x11/BarWindow.hpp"
#include "x11/XEventSource.hpp"
#include "x11/XftSurface.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <format>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <poll.h>
#include <string>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;
using namespace lazybar;
using util::Logger;

namespace {

constexpr auto PANEL_REPLY_TIMEOUT = 5s;
constexpr auto SHUTDOWN_TIMEOUT = 5s;
constexpr auto WORKER_GRACE = 1s;
// X, waker, shutdown request, signals, IPC listener; waiting IPC clients follow
constexpr size_t FIXED_POLL_FDS = 5;
// Updates handled per loop iteration before X and IPC get a turn
constexpr int MAX_UPDATES_PER_TURN = 64;

struct Options {
    std::string bar_name;
    std::optional<std::filesystem::path> config_path;
    bool verbose = false;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <bar> [--config <path>] [--verbose]\n"
              << "\n"
              << "Runs the bar defined in [bars.<bar>] of the configuration file.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <path>  Use this configuration file\n"
              << "  -v, --verbose        Write debug messages to the log\n"
              << "  -h, --help           Show this help\n";
}

// Returns nullopt after printing usage or an error.
std::optional<Options> parse_args(int argc, char** argv, int& exit_code) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            exit_code = 0;
            return std::nullopt;
        }
        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a path\n";
                exit_code = 2;
                return std::nullopt;
            }
            options.config_path = argv[++i];
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option " << arg << "\n";
            exit_code = 2;
            return std::nullopt;
        }
        if (!options.bar_name.empty()) {
            std::cerr << "Only one bar name may be given\n";
            exit_code = 2;
            return std::nullopt;
        }
        options.bar_name = arg;
    }

    if (options.bar_name.empty()) {
        print_usage(argv[0]);
        exit_code = 2;
        return std::nullopt;
    }
    return options;
}

void add_panels(runtime::Orchestrator& orchestrator, const config::Config& config, bar::Alignment alignment,
                const std::vector<std::string>& names) {
    auto& registry = panels::PanelRegistry::instance();
    for (const auto& name : names) {
        orchestrator.add(alignment, registry.create(name, config));
    }
}

void apply_update(bar::Bar& bar, bar::Alignment alignment, size_t index, bar::PanelUpdate update) {
    if (!update.is_valid || !update.info) {
        Logger::error(runtime::format_panel_error(alignment, index, update.error_message));
        return;
    }
    try {
        bar.update_panel(alignment, index, std::move(*update.info));
    } catch (const draw::DrawError& e) {
        Logger::error(std::format("Main: Redraw after {} panel {} failed: {}", bar::alignment_name(alignment),
                                  index, e.what()));
    }
}

// Replies to a message whose answer comes from a panel, off the loop thread.
void reply_later(ipc::IpcConnection connection, bar::MessageOutcome outcome) {
    struct PendingReply {
        ipc::IpcConnection connection;
        std::future<bar::EventResponse> reply;
        std::string panel_name;
    };
    auto pending = std::make_shared<PendingReply>(
        PendingReply{std::move(connection), std::move(outcome.reply), outcome.panel_name});

    bool submitted = runtime::WorkerPool::instance().submit_job([pending]() {
        bar::EventResponse response;
        if (pending->reply.wait_for(PANEL_REPLY_TIMEOUT) == std::future_status::ready) {
            try {
                response = pending->reply.get();
            } catch (const std::future_error&) {
                // The panel dropped the event without answering
                response = bar::EventResponse::failure("Panel " + pending->panel_name + " did not respond");
            }
        } else {
            response = bar::EventResponse::failure("Panel " + pending->panel_name + " did not respond");
        }
        if (!pending->connection.respond(response)) {
            Logger::warn("Main: Failed to reply to IPC client");
        }
    });

    if (!submitted) {
        Logger::warn("Main: Worker queue full, dropping IPC reply wait");
        if (!pending->connection.respond(bar::EventResponse::failure("Bar is busy"))) {
            Logger::warn("Main: Failed to reply to IPC client");
        }
    }
}

void handle_ipc_message(ipc::IpcConnection connection, bar::EventRouter& router, runtime::Shutdown& shutdown) {
    Logger::debug("Main: IPC message " + connection.message());
    auto outcome = router.route_message(connection.message());

    switch (outcome.kind) {
        case bar::MessageOutcome::Kind::Quit:
            Logger::info("Main: Quit requested over IPC");
            if (!connection.respond(bar::EventResponse::success())) {
                Logger::warn("Main: Failed to acknowledge quit");
            }
            shutdown.request(0);
            return;
        case bar::MessageOutcome::Kind::Immediate:
            if (!connection.respond(outcome.response)) {
                Logger::warn("Main: Failed to reply to IPC client");
            }
            break;
        case bar::MessageOutcome::Kind::Pending:
            reply_later(std::move(connection), std::move(outcome));
            break;
    }
}

int run(const Options& options) {
    runtime::Shutdown shutdown;
    // Before any worker thread exists, so the mask is inherited
    if (!shutdown.watch_signals()) {
        Logger::error("Main: Failed to set up signal handling");
        return 1;
    }

    auto config_path = util::Platform::find_config_file(options.config_path);
    if (!config_path) {
        throw config::ConfigError("No configuration file found");
    }
    Logger::info("Main: Using configuration " + config_path->string());

    auto config = config::ConfigLoader::load_from_file(*config_path);
    auto bar_config = config::ConfigLoader::parse_bar(config, options.bar_name);

    x11::BarWindow window(bar_config.name, bar_config.position, bar_config.height);
    if (!window.init()) {
        throw std::runtime_error("Failed to create the bar window");
    }
    x11::BarWindow::install_error_handlers(shutdown);

    x11::XftSurface surface(window);
    if (!surface.init()) {
        throw std::runtime_error("Failed to create the drawing surface");
    }

    std::unique_ptr<ipc::IpcServer> server;
    if (bar_config.ipc) {
        server = std::make_unique<ipc::IpcServer>(util::Platform::get_ipc_socket_path(bar_config.name));
        if (!server->init()) {
            throw std::runtime_error("Another bar named " + bar_config.name + " is already running");
        }
    }

    runtime::Scheduler scheduler;
    runtime::LoopWaker loop_waker;
    auto waker = loop_waker.waker();

    runtime::Orchestrator orchestrator(surface, bar_config.default_attrs, bar_config.height, scheduler);
    add_panels(orchestrator, config, bar::Alignment::Left, bar_config.panels_left);
    add_panels(orchestrator, config, bar::Alignment::Center, bar_config.panels_center);
    add_panels(orchestrator, config, bar::Alignment::Right, bar_config.panels_right);
    auto bring_up = orchestrator.start();

    bar::BarSettings settings;
    settings.name = bar_config.name;
    settings.width = window.width();
    settings.height = bar_config.height;
    settings.margins = bar_config.margins;
    settings.background = bar_config.background;
    settings.reverse_scroll = bar_config.reverse_scroll;

    bar::Bar bar(settings, surface, &window);
    bar.set_panels(bar::Alignment::Left, std::move(bring_up.left));
    bar.set_panels(bar::Alignment::Center, std::move(bring_up.center));
    bar.set_panels(bar::Alignment::Right, std::move(bring_up.right));
    // Panels stop before the socket goes away
    shutdown.add_hook([&bar]() { bar.shutdown_panels(); });
    if (server) {
        ipc::IpcServer* raw = server.get();
        shutdown.add_hook([raw]() { raw->remove_socket(); });
    }

    bar::EventRouter router(bar);
    x11::XEventSource input(window.display(), window.window());
    auto& streams = *bring_up.streams;
    bool streams_done = false;

    window.map();
    bar.redraw_bar();
    Logger::info("Main: Bar " + bar_config.name + " running");

    while (!shutdown.requested()) {
        scheduler.process();
        loop_waker.drain();

        int handled = 0;
        while (!streams_done && handled < MAX_UPDATES_PER_TURN) {
            auto poll = streams.poll_next(waker);
            if (poll.is_pending()) break;
            if (poll.is_done()) {
                Logger::info("Main: All panel streams have finished");
                streams_done = true;
                break;
            }
            auto [alignment, indexed] = poll.take();
            apply_update(bar, alignment, indexed.first, std::move(indexed.second));
            ++handled;
        }

        int timeout_ms = -1;
        auto wait_at_most = [&timeout_ms](std::chrono::milliseconds wait) {
            int ms = static_cast<int>(wait.count());
            if (timeout_ms < 0 || ms < timeout_ms) timeout_ms = ms;
        };
        if (handled >= MAX_UPDATES_PER_TURN) {
            timeout_ms = 0;
        } else if (auto next = scheduler.time_until_next()) {
            wait_at_most(*next);
        }

        std::vector<pollfd> fds = {
            {window.connection_fd(), POLLIN, 0},
            {loop_waker.fd(), POLLIN, 0},
            {shutdown.request_fd(), POLLIN, 0},
            {shutdown.signal_fd(), POLLIN, 0},
            {server ? server->fd() : -1, POLLIN, 0},
        };
        if (server) {
            for (int client_fd : server->client_fds()) {
                fds.push_back({client_fd, POLLIN, 0});
            }
            if (auto drop = server->time_until_next_drop()) wait_at_most(*drop);
        }

        // Xlib may already hold queued events that poll() would not report
        if (XPending(window.display()) > 0) timeout_ms = 0;

        int ready = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::error(std::string("Main: poll failed: ") + std::strerror(errno));
            shutdown.request(1);
            break;
        }

        if (fds[3].revents & POLLIN) {
            shutdown.handle_signal_fd();
        }
        if (shutdown.requested()) break;

        for (const auto& event : input.drain()) {
            try {
                if (event.type == x11::InputEvent::Type::Redraw) {
                    bar.redraw_bar();
                } else {
                    router.route_button(event.press);
                }
            } catch (const draw::DrawError& e) {
                Logger::error(std::string("Main: Redraw failed: ") + e.what());
            }
        }

        if (server) {
            for (size_t i = FIXED_POLL_FDS; i < fds.size() && !shutdown.requested(); ++i) {
                if (fds[i].revents == 0) continue;
                if (auto connection = server->read_message(fds[i].fd)) {
                    handle_ipc_message(std::move(*connection), router, shutdown);
                }
            }
            if (fds[4].revents & POLLIN) server->accept_clients();
            server->drop_silent_clients();
        }
    }

    Logger::info("Main: Shutting down");
    shutdown.arm_watchdog(SHUTDOWN_TIMEOUT);
    shutdown.run_hooks();

    // A job stuck in a shell command or a panel reply would block the pool's
    // join at static destruction
    if (!runtime::WorkerPool::instance().stop(WORKER_GRACE)) {
        Logger::warn("Main: Exiting with worker jobs still running");
        _exit(shutdown.exit_code());
    }
    return shutdown.exit_code();
}

}  // namespace

int main(int argc, char** argv) {
    int exit_code = 0;
    auto options = parse_args(argc, argv, exit_code);
    if (!options) return exit_code;

    try {
        Logger::init(options->bar_name);
        Logger::set_min_level(options->verbose ? Logger::Level::Debug : Logger::Level::Info);
        Logger::info("lazybar starting...");
        int code = run(*options);
        Logger::info("lazybar shutdown");
        return code;
    } catch (const std::exception& e) {
        Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
