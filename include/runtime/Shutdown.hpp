#pragma once

#include "runtime/EventFd.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lazybar::runtime {

/**
 * One-shot shutdown channel created once in main and handed to everything
 * that can trigger or must observe shutdown (IPC "quit", X connection loss,
 * SIGINT/SIGTERM).
 */
class Shutdown {
public:
    using Hook = std::function<void()>;

    Shutdown() = default;
    ~Shutdown();
    Shutdown(const Shutdown&) = delete;
    Shutdown& operator=(const Shutdown&) = delete;

    // Blocks SIGINT/SIGTERM/SIGHUP for the process and routes them through a
    // signalfd. Must run before any other thread is spawned.
    [[nodiscard]] bool watch_signals();
    int signal_fd() const { return signal_fd_; }
    // Consumes pending signals from signal_fd and requests shutdown.
    void handle_signal_fd();

    void request(int exit_code = 0);
    bool requested() const { return requested_.load(); }
    int exit_code() const { return exit_code_.load(); }
    int request_fd() const { return request_event_.fd(); }

    // Hooks run in registration order, at most once.
    void add_hook(Hook hook);
    void run_hooks();

    // Forces _exit(exit_code) if the process is still alive after timeout.
    void arm_watchdog(std::chrono::milliseconds timeout);

private:
    EventFd request_event_;
    int signal_fd_ = -1;
    std::atomic<bool> requested_{false};
    std::atomic<int> exit_code_{0};

    std::mutex hooks_mutex_;
    std::vector<Hook> hooks_;
    bool hooks_ran_ = false;

    std::jthread watchdog_;
};

}  // namespace lazybar::runtime
