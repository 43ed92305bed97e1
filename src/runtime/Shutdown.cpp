#include "runtime/Shutdown.hpp"
#include "util/Logger.hpp"
#include <csignal>
#include <cerrno>
#include <cstring>
#include <sys/signalfd.h>
#include <unistd.h>

namespace lazybar::runtime {

Shutdown::~Shutdown() {
    if (signal_fd_ >= 0) {
        close(signal_fd_);
    }
}

bool Shutdown::watch_signals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);

    if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        util::Logger::error("Shutdown: Failed to block termination signals");
        return false;
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        util::Logger::error(std::string("Shutdown: signalfd failed: ") + std::strerror(errno));
        return false;
    }
    return true;
}

void Shutdown::handle_signal_fd() {
    signalfd_siginfo info{};
    while (true) {
        ssize_t n = read(signal_fd_, &info, sizeof(info));
        if (n < 0 && errno == EINTR) continue;
        if (n != static_cast<ssize_t>(sizeof(info))) break;

        util::Logger::info("Shutdown: Received signal " + std::to_string(info.ssi_signo));
        request(0);
    }
}

void Shutdown::request(int exit_code) {
    bool expected = false;
    if (requested_.compare_exchange_strong(expected, true)) {
        exit_code_.store(exit_code);
    }
    request_event_.signal();
}

void Shutdown::add_hook(Hook hook) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    hooks_.push_back(std::move(hook));
}

void Shutdown::run_hooks() {
    std::vector<Hook> hooks;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        if (hooks_ran_) return;
        hooks_ran_ = true;
        hooks.swap(hooks_);
    }

    for (auto& hook : hooks) {
        try {
            hook();
        } catch (const std::exception& e) {
            util::Logger::error(std::string("Shutdown: Hook failed: ") + e.what());
        }
    }
}

void Shutdown::arm_watchdog(std::chrono::milliseconds timeout) {
    if (watchdog_.joinable()) return;

    watchdog_ = std::jthread([this, timeout](std::stop_token st) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!st.stop_requested()) {
            util::Logger::error("Shutdown: Timed out, forcing exit");
            _exit(exit_code_.load());
        }
    });
}

}  // namespace lazybar::runtime
