#include "util/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace lazybar::util {

static std::mutex log_mutex;
static std::ofstream log_file;
static std::string log_path = "/tmp/lazybar.log";
static Logger::Level min_level = Logger::Level::Debug;

void Logger::init(const std::string& bar_name) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = std::format("/tmp/lazybar_{}.log", bar_name);
    log_file.open(log_path, std::ios::trunc);
}

void Logger::set_min_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level) return;
    if (!log_file.is_open()) {
        // Tests and lazybar-msg never call init()
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace lazybar::util
