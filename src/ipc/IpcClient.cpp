#include "ipc/IpcClient.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace lazybar::ipc {

using util::Logger;

static int connect_socket(const std::filesystem::path& socket_path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::string path = socket_path.string();
    if (path.size() >= sizeof(addr.sun_path)) return -1;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool socket_is_live(const std::filesystem::path& socket_path) {
    int fd = connect_socket(socket_path);
    if (fd < 0) return false;
    ::close(fd);
    return true;
}

std::optional<std::string> send_message(const std::filesystem::path& socket_path,
                                        const std::string& message,
                                        std::chrono::milliseconds timeout) {
    int fd = connect_socket(socket_path);
    if (fd < 0) {
        Logger::error("IpcClient: Cannot connect to " + socket_path.string() + ": " + std::strerror(errno));
        return std::nullopt;
    }

    size_t written = 0;
    while (written < message.size()) {
        ssize_t n = ::send(fd, message.data() + written, message.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            Logger::error(std::string("IpcClient: send() failed: ") + std::strerror(errno));
            ::close(fd);
            return std::nullopt;
        }
        written += static_cast<size_t>(n);
    }
    ::shutdown(fd, SHUT_WR);

    std::string response;
    char buffer[512];
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            Logger::error("IpcClient: Timed out waiting for response");
            ::close(fd);
            return std::nullopt;
        }

        pollfd pfd{fd, POLLIN, 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            ::close(fd);
            return std::nullopt;
        }
        if (ret == 0) continue;

        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(fd);
            return std::nullopt;
        }
        if (n == 0) break;
        response.append(buffer, static_cast<size_t>(n));
    }

    ::close(fd);
    return response;
}

std::optional<bar::EventResponse> parse_response(const std::string& json_text) {
    auto j = nlohmann::json::parse(json_text, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("success") || !j["success"].is_string()) {
        return std::nullopt;
    }

    if (j["success"].get<std::string>() == "true") {
        return bar::EventResponse::success();
    }
    return bar::EventResponse::failure(j.value("reason", std::string{}));
}

}  // namespace lazybar::ipc
