#include "bar/Event.hpp"
#include "util/Logger.hpp"
#include <nlohmann/json.hpp>

namespace lazybar::bar {

std::string EventResponse::to_json() const {
    nlohmann::ordered_json j;
    j["success"] = ok ? "true" : "false";
    if (!ok) {
        j["reason"] = reason;
    }
    return j.dump();
}

void Event::respond(EventResponse response) const {
    if (!reply) return;
    try {
        reply->set_value(std::move(response));
    } catch (const std::future_error& e) {
        util::Logger::warn(std::string("Event: Reply already sent: ") + e.what());
    }
}

}  // namespace lazybar::bar
