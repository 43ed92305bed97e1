#include "config/ConfigLoader.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace lazybar::config {

using util::Logger;

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> Table::keys() const {
    std::vector<std::string> result;
    for (const auto& [key, value] : values_) result.push_back(key);
    for (const auto& [key, value] : arrays_) result.push_back(key);
    return result;
}

std::optional<std::string> Table::get_string(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        if (arrays_.count(key)) {
            throw ConfigError(std::format("[{}] {}: expected a string, found an array", name_, key));
        }
        return std::nullopt;
    }
    return it->second;
}

std::optional<long> Table::get_int(const std::string& key) const {
    auto value = get_string(key);
    if (!value) return std::nullopt;

    long result = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
    if (ec != std::errc() || ptr != value->data() + value->size()) {
        throw ConfigError(std::format("[{}] {}: expected an integer, found \"{}\"", name_, key, *value));
    }
    return result;
}

std::optional<double> Table::get_double(const std::string& key) const {
    auto value = get_string(key);
    if (!value) return std::nullopt;

    try {
        size_t used = 0;
        double result = std::stod(*value, &used);
        if (used == value->size()) return result;
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw ConfigError(std::format("[{}] {}: expected a number, found \"{}\"", name_, key, *value));
}

std::optional<bool> Table::get_bool(const std::string& key) const {
    auto value = get_string(key);
    if (!value) return std::nullopt;

    if (*value == "true") return true;
    if (*value == "false") return false;
    throw ConfigError(std::format("[{}] {}: expected true or false, found \"{}\"", name_, key, *value));
}

std::optional<draw::Color> Table::get_color(const std::string& key) const {
    auto value = get_string(key);
    if (!value) return std::nullopt;

    auto color = draw::Color::parse(*value);
    if (!color) {
        throw ConfigError(std::format("[{}] {}: invalid color \"{}\"", name_, key, *value));
    }
    return color;
}

std::optional<std::vector<std::string>> Table::get_array(const std::string& key) const {
    auto it = arrays_.find(key);
    if (it == arrays_.end()) {
        if (values_.count(key)) {
            throw ConfigError(std::format("[{}] {}: expected an array", name_, key));
        }
        return std::nullopt;
    }
    return it->second;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    Logger::info("Config: Loading " + path.string());

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

Config ConfigLoader::load_from_string(const std::string& text) {
    Config cfg;
    std::istringstream input(text);
    std::string line;
    std::string current_section;
    int line_no = 0;

    while (std::getline(input, line)) {
        ++line_no;
        line = trim(line);

        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[') {
            if (line.back() != ']') {
                throw ConfigError(std::format("line {}: unterminated section header", line_no));
            }
            current_section = trim(line.substr(1, line.length() - 2));
            if (current_section.empty()) {
                throw ConfigError(std::format("line {}: empty section name", line_no));
            }
            cfg.sections.try_emplace(current_section, current_section);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            throw ConfigError(std::format("line {}: expected key = value", line_no));
        }
        if (current_section.empty()) {
            throw ConfigError(std::format("line {}: key outside of any section", line_no));
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            throw ConfigError(std::format("line {}: missing key", line_no));
        }

        auto& table = cfg.sections.at(current_section);
        if (!value.empty() && value.front() == '[') {
            table.set_array(key, parse_array(value, line_no));
        } else {
            table.set(key, unquote(value, line_no));
        }
    }

    Logger::debug("Config: Parsed " + std::to_string(cfg.sections.size()) + " sections");
    return cfg;
}

std::string ConfigLoader::unquote(const std::string& value, int line_no) {
    if (value.empty() || value.front() != '"') {
        return value;
    }
    if (value.size() < 2 || value.back() != '"') {
        throw ConfigError(std::format("line {}: unterminated string", line_no));
    }

    std::string result;
    for (size_t i = 1; i + 1 < value.size(); ++i) {
        char c = value[i];
        if (c == '\\' && i + 2 < value.size()) {
            char next = value[++i];
            switch (next) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                default: result += next; break;
            }
        } else {
            result += c;
        }
    }
    return result;
}

std::vector<std::string> ConfigLoader::parse_array(const std::string& value, int line_no) {
    if (value.back() != ']') {
        throw ConfigError(std::format("line {}: arrays must fit on one line", line_no));
    }

    std::vector<std::string> items;
    std::string inner = value.substr(1, value.size() - 2);
    size_t pos = 0;
    while (pos < inner.size()) {
        while (pos < inner.size() && (inner[pos] == ' ' || inner[pos] == '\t' || inner[pos] == ',')) ++pos;
        if (pos >= inner.size()) break;

        if (inner[pos] == '"') {
            size_t end = pos + 1;
            while (end < inner.size() && !(inner[end] == '"' && inner[end - 1] != '\\')) ++end;
            if (end >= inner.size()) {
                throw ConfigError(std::format("line {}: unterminated string in array", line_no));
            }
            items.push_back(unquote(inner.substr(pos, end - pos + 1), line_no));
            pos = end + 1;
        } else {
            size_t end = inner.find(',', pos);
            if (end == std::string::npos) end = inner.size();
            items.push_back(trim(inner.substr(pos, end - pos)));
            pos = end;
        }
    }
    return items;
}

BarConfig ConfigLoader::parse_bar(const Config& config, const std::string& bar_name) {
    const Table* table = config.section("bars." + bar_name);
    if (!table) {
        throw ConfigError("No bar named " + bar_name + " ([bars." + bar_name + "]) in config");
    }

    BarConfig bar;
    bar.name = bar_name;

    auto position = util::fold_case(table->get_string_or("position", "top"));
    if (position == "top") {
        bar.position = Position::Top;
    } else if (position == "bottom") {
        bar.position = Position::Bottom;
    } else {
        throw ConfigError("[bars." + bar_name + "] position: expected top or bottom, found " + position);
    }

    bar.height = static_cast<int>(table->get_int("height").value_or(24));
    if (bar.height <= 0) {
        throw ConfigError("[bars." + bar_name + "] height must be positive");
    }

    bar.background = table->get_color("bg").value_or(draw::Color{0, 0, 0, 255});

    if (auto attrs_name = table->get_string("default_attrs")) {
        bar.default_attrs = parse_attrs(config, *attrs_name);
    }
    if (auto font = table->get_string("font")) bar.default_attrs.font = font;
    if (auto fg = table->get_color("fg")) bar.default_attrs.fg = fg;
    if (!bar.default_attrs.font) bar.default_attrs.font = "monospace:size=10";
    if (!bar.default_attrs.fg) bar.default_attrs.fg = draw::Color{255, 255, 255, 255};

    bar.margins.left = table->get_double("margin_left").value_or(0.0);
    bar.margins.internal = table->get_double("margin_internal").value_or(0.0);
    bar.margins.right = table->get_double("margin_right").value_or(0.0);

    bar.reverse_scroll = table->get_bool("reverse_scroll").value_or(false);
    bar.ipc = table->get_bool("ipc").value_or(true);

    bar.panels_left = table->get_array("panels_left").value_or(std::vector<std::string>{});
    bar.panels_center = table->get_array("panels_center").value_or(std::vector<std::string>{});
    bar.panels_right = table->get_array("panels_right").value_or(std::vector<std::string>{});

    Logger::info(std::format("Config: Bar {} has {}/{}/{} panels", bar_name, bar.panels_left.size(),
                             bar.panels_center.size(), bar.panels_right.size()));
    return bar;
}

draw::Attrs ConfigLoader::parse_attrs(const Config& config, const std::string& name) {
    const Table* table = config.section("attrs." + name);
    if (!table) {
        throw ConfigError("No attrs named " + name + " ([attrs." + name + "]) in config");
    }

    draw::Attrs attrs;
    attrs.font = table->get_string("font");
    attrs.fg = table->get_color("fg");
    attrs.bg = table->get_color("bg");
    return attrs;
}

}  // namespace lazybar::config
