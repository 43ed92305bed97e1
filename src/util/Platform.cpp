#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace lazybar::util {

std::filesystem::path Platform::get_config_directory() {
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "lazybar";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "lazybar";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/lazybar");
    return ".config/lazybar";
}

std::optional<std::filesystem::path> Platform::find_config_file(
    const std::optional<std::filesystem::path>& explicit_path) {
    std::error_code ec;
    if (explicit_path) {
        if (std::filesystem::exists(*explicit_path, ec)) {
            return explicit_path;
        }
        Logger::error("Platform: Config file " + explicit_path->string() + " does not exist");
        return std::nullopt;
    }

    const std::filesystem::path candidates[] = {
        get_config_directory() / "config.toml",
        "/etc/lazybar/config.toml",
    };
    for (const auto& candidate : candidates) {
        Logger::debug("Platform: Trying config file " + candidate.string());
        if (std::filesystem::exists(candidate, ec)) {
            Logger::info("Platform: Using config file " + candidate.string());
            return candidate;
        }
    }
    return std::nullopt;
}

std::filesystem::path Platform::get_ipc_directory() {
    return "/tmp/lazybar-ipc";
}

std::filesystem::path Platform::get_ipc_socket_path(const std::string& bar_name) {
    return get_ipc_directory() / bar_name;
}

std::optional<std::string> Platform::read_file_trimmed(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();
    while (!content.empty() && (content.back() == '\n' || content.back() == '\r')) {
        content.pop_back();
    }
    return content;
}

}  // namespace lazybar::util
