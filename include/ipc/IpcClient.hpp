#pragma once

#include "bar/Event.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace lazybar::ipc {

// True if something accepts connections on the socket.
bool socket_is_live(const std::filesystem::path& socket_path);

// Sends one message and returns the raw response, or nullopt on failure.
std::optional<std::string> send_message(const std::filesystem::path& socket_path,
                                        const std::string& message,
                                        std::chrono::milliseconds timeout = std::chrono::seconds(6));

std::optional<bar::EventResponse> parse_response(const std::string& json_text);

}  // namespace lazybar::ipc
