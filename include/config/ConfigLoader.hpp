#pragma once

#include "bar/Extents.hpp"
#include "draw/Attrs.hpp"
#include "draw/Color.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lazybar::config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Key/value pairs of one [section]. Typed getters throw ConfigError when a
// present value has the wrong shape.
class Table {
public:
    explicit Table(std::string name = {}) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    void set(const std::string& key, std::string value) { values_[key] = std::move(value); }
    void set_array(const std::string& key, std::vector<std::string> values) { arrays_[key] = std::move(values); }

    bool contains(const std::string& key) const { return values_.count(key) || arrays_.count(key); }
    std::vector<std::string> keys() const;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<long> get_int(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;
    std::optional<draw::Color> get_color(const std::string& key) const;
    std::optional<std::vector<std::string>> get_array(const std::string& key) const;

    std::string get_string_or(const std::string& key, const std::string& fallback) const {
        return get_string(key).value_or(fallback);
    }

private:
    std::string name_;
    std::map<std::string, std::string> values_;
    std::map<std::string, std::vector<std::string>> arrays_;
};

struct Config {
    std::map<std::string, Table> sections;

    const Table* section(const std::string& name) const {
        auto it = sections.find(name);
        return it == sections.end() ? nullptr : &it->second;
    }
};

enum class Position { Top, Bottom };

struct BarConfig {
    std::string name;
    Position position = Position::Top;
    int height = 24;
    draw::Color background{0, 0, 0, 255};
    draw::Attrs default_attrs;
    bar::Margins margins;
    bool reverse_scroll = false;
    bool ipc = true;

    std::vector<std::string> panels_left;
    std::vector<std::string> panels_center;
    std::vector<std::string> panels_right;
};

class ConfigLoader {
public:
    // Throws ConfigError if the file cannot be read or has a syntax error.
    static Config load_from_file(const std::filesystem::path& path);
    static Config load_from_string(const std::string& text);

    // Reads [bars.<bar_name>]. Throws ConfigError if it is missing or invalid.
    static BarConfig parse_bar(const Config& config, const std::string& bar_name);

    // Reads [attrs.<name>]. Throws ConfigError if it is missing.
    static draw::Attrs parse_attrs(const Config& config, const std::string& name);

private:
    static std::vector<std::string> parse_array(const std::string& value, int line_no);
    static std::string unquote(const std::string& value, int line_no);
};

}  // namespace lazybar::config
