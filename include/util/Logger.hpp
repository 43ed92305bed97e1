#pragma once

#include <string>

namespace lazybar::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens /tmp/lazybar_<bar_name>.log, truncating any previous run.
    static void init(const std::string& bar_name);
    static void set_min_level(Level level);
    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace lazybar::util
