#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace lazybar::util {

class Platform {
public:
    // $XDG_CONFIG_HOME/lazybar, falling back to $HOME/.config/lazybar
    static std::filesystem::path get_config_directory();

    // First existing file among: explicit path, the config directory's
    // config.toml, /etc/lazybar/config.toml. Returns nullopt if none exist.
    static std::optional<std::filesystem::path> find_config_file(
        const std::optional<std::filesystem::path>& explicit_path);

    static std::filesystem::path get_ipc_directory();
    static std::filesystem::path get_ipc_socket_path(const std::string& bar_name);

    // Reads a whole sysfs/procfs style file, trailing newline stripped.
    static std::optional<std::string> read_file_trimmed(const std::filesystem::path& path);
};

}  // namespace lazybar::util
