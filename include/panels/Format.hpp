#pragma once

#include <string>
#include <utility>
#include <vector>

namespace lazybar::panels {

// Replaces every %key% in format with its value, in the order given.
inline std::string substitute(std::string format,
                              const std::vector<std::pair<std::string, std::string>>& values) {
    for (const auto& [key, value] : values) {
        const std::string token = "%" + key + "%";
        size_t pos = 0;
        while ((pos = format.find(token, pos)) != std::string::npos) {
            format.replace(pos, token.size(), value);
            pos += value.size();
        }
    }
    return format;
}

}  // namespace lazybar::panels
