#include "ipc/IpcServer.hpp"
#include "ipc/IpcClient.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace lazybar::ipc {

using util::Logger;

IpcConnection::~IpcConnection() {
    close_fd();
}

IpcConnection::IpcConnection(IpcConnection&& other) noexcept
    : fd_(other.fd_), message_(std::move(other.message_)) {
    other.fd_ = -1;
}

IpcConnection& IpcConnection::operator=(IpcConnection&& other) noexcept {
    if (this != &other) {
        close_fd();
        fd_ = other.fd_;
        message_ = std::move(other.message_);
        other.fd_ = -1;
    }
    return *this;
}

void IpcConnection::close_fd() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool IpcConnection::respond(const bar::EventResponse& response) {
    if (fd_ < 0) return false;

    std::string body = response.to_json();
    size_t written = 0;
    bool ok = true;
    while (written < body.size()) {
        ssize_t n = ::send(fd_, body.data() + written, body.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            Logger::warn(std::string("IpcConnection: Failed to write response: ") + std::strerror(errno));
            ok = false;
            break;
        }
        written += static_cast<size_t>(n);
    }

    ::shutdown(fd_, SHUT_RDWR);
    close_fd();
    return ok;
}

IpcServer::IpcServer(std::filesystem::path socket_path, std::chrono::milliseconds read_timeout)
    : socket_path_(std::move(socket_path)), read_timeout_(read_timeout) {}

IpcServer::~IpcServer() {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        // Only the bar that bound the socket removes it
        std::error_code ec;
        std::filesystem::remove(socket_path_, ec);
    }
}

bool IpcServer::init() {
    std::error_code ec;
    std::filesystem::create_directories(socket_path_.parent_path(), ec);
    if (ec) {
        Logger::error("IpcServer: Cannot create " + socket_path_.parent_path().string() + ": " + ec.message());
        return false;
    }

    if (std::filesystem::exists(socket_path_, ec)) {
        if (socket_is_live(socket_path_)) {
            Logger::error("IpcServer: " + socket_path_.string() + " is in use by another bar");
            return false;
        }
        Logger::info("IpcServer: Removing stale socket " + socket_path_.string());
        std::filesystem::remove(socket_path_, ec);
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::string path = socket_path_.string();
    if (path.size() >= sizeof(addr.sun_path)) {
        Logger::error("IpcServer: Socket path too long: " + path);
        return false;
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        Logger::error(std::string("IpcServer: socket() failed: ") + std::strerror(errno));
        return false;
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(listen_fd_, 16) < 0) {
        Logger::error("IpcServer: Cannot listen on " + path + ": " + std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    Logger::info("IpcServer: Listening on " + path);
    return true;
}

void IpcServer::accept_clients() {
    if (listen_fd_ < 0) return;

    while (true) {
        int client = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                Logger::warn(std::string("IpcServer: accept() failed: ") + std::strerror(errno));
            }
            return;
        }
        // Owns client from here on
        IpcConnection connection(client, {});
        if (waiting_.size() >= MAX_WAITING_CLIENTS) {
            Logger::warn("IpcServer: Too many clients waiting, dropping connection");
            continue;
        }
        waiting_.push_back(WaitingClient{std::move(connection), std::chrono::steady_clock::now() + read_timeout_});
    }
}

std::vector<int> IpcServer::client_fds() const {
    std::vector<int> fds;
    fds.reserve(waiting_.size());
    for (const auto& client : waiting_) {
        fds.push_back(client.connection.fd());
    }
    return fds;
}

std::optional<IpcConnection> IpcServer::read_message(int client_fd) {
    auto it = std::find_if(waiting_.begin(), waiting_.end(),
                           [client_fd](const WaitingClient& client) { return client.connection.fd() == client_fd; });
    if (it == waiting_.end()) return std::nullopt;

    char buffer[MAX_MESSAGE_SIZE];
    ssize_t n;
    do {
        n = ::recv(client_fd, buffer, sizeof(buffer), 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return std::nullopt;
    }

    IpcConnection connection = std::move(it->connection);
    waiting_.erase(it);

    if (n <= 0) {
        if (n < 0) {
            Logger::warn(std::string("IpcServer: recv() failed: ") + std::strerror(errno));
        }
        return std::nullopt;
    }

    // The reply may be written from a worker thread, which expects blocking writes
    int flags = ::fcntl(client_fd, F_GETFL);
    if (flags >= 0) {
        ::fcntl(client_fd, F_SETFL, flags & ~O_NONBLOCK);
    }

    connection.message_.assign(buffer, static_cast<size_t>(n));
    Logger::debug("IpcServer: Received message: " + connection.message());
    return connection;
}

void IpcServer::drop_silent_clients() {
    auto now = std::chrono::steady_clock::now();
    auto silent = std::remove_if(waiting_.begin(), waiting_.end(),
                                 [now](const WaitingClient& client) { return client.deadline <= now; });
    if (silent != waiting_.end()) {
        Logger::warn(std::format("IpcServer: {} clients sent nothing, dropping them", waiting_.end() - silent));
        waiting_.erase(silent, waiting_.end());
    }
}

std::optional<std::chrono::milliseconds> IpcServer::time_until_next_drop() const {
    if (waiting_.empty()) return std::nullopt;

    auto earliest = waiting_.front().deadline;
    for (const auto& client : waiting_) {
        earliest = std::min(earliest, client.deadline);
    }
    auto wait = std::chrono::ceil<std::chrono::milliseconds>(earliest - std::chrono::steady_clock::now());
    return std::max(wait, std::chrono::milliseconds(0));
}

void IpcServer::remove_socket() {
    waiting_.clear();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    std::error_code ec;
    if (std::filesystem::remove(socket_path_, ec)) {
        Logger::info("IpcServer: Removed socket " + socket_path_.string());
    } else if (ec) {
        Logger::warn("IpcServer: Could not remove " + socket_path_.string() + ": " + ec.message());
    }
}

}  // namespace lazybar::ipc
