#pragma once

#include "bar/Event.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lazybar::ipc {

// One accepted client. Closed on destruction; respond() at most once.
class IpcConnection {
public:
    IpcConnection(int fd, std::string message) : fd_(fd), message_(std::move(message)) {}
    ~IpcConnection();
    IpcConnection(IpcConnection&& other) noexcept;
    IpcConnection& operator=(IpcConnection&& other) noexcept;
    IpcConnection(const IpcConnection&) = delete;
    IpcConnection& operator=(const IpcConnection&) = delete;

    const std::string& message() const { return message_; }
    int fd() const { return fd_; }

    // Writes the JSON response and shuts the socket down.
    [[nodiscard]] bool respond(const bar::EventResponse& response);

private:
    friend class IpcServer;

    void close_fd();

    int fd_ = -1;
    std::string message_;
};

/**
 * Listening unix socket at /tmp/lazybar-ipc/<bar>. Every fd it owns is
 * non-blocking: the event loop polls the listening fd and the fds of
 * clients that have connected but not yet sent their message, and calls
 * back in when one is readable.
 */
class IpcServer {
public:
    static constexpr size_t MAX_MESSAGE_SIZE = 1024;
    static constexpr size_t MAX_WAITING_CLIENTS = 16;

    explicit IpcServer(std::filesystem::path socket_path,
                       std::chrono::milliseconds read_timeout = std::chrono::milliseconds(200));
    ~IpcServer();
    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    // Fails if another live bar owns the socket. A stale socket is replaced.
    [[nodiscard]] bool init();

    int fd() const { return listen_fd_; }
    const std::filesystem::path& socket_path() const { return socket_path_; }

    // Accepts every client queued on the listening socket without reading.
    void accept_clients();

    // Clients still waiting to be read, for the caller's poll set.
    std::vector<int> client_fds() const;

    // Reads the message of a waiting client. Returns nullopt if the client
    // is not waiting, has nothing to read yet, or hung up without sending.
    std::optional<IpcConnection> read_message(int client_fd);

    // Closes clients that stayed silent past the read timeout.
    void drop_silent_clients();
    std::optional<std::chrono::milliseconds> time_until_next_drop() const;

    // Stops listening and deletes the socket file.
    void remove_socket();

private:
    struct WaitingClient {
        IpcConnection connection;
        std::chrono::steady_clock::time_point deadline;
    };

    std::filesystem::path socket_path_;
    std::chrono::milliseconds read_timeout_;
    int listen_fd_ = -1;
    std::vector<WaitingClient> waiting_;
};

}  // namespace lazybar::ipc
