#include "messaging/dispatch_registry.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace wordbase {

DispatchRegistry::DispatchRegistry(std::vector<PurposeRoute> routes) {
    for (auto& route : routes) {
        if (route.tag.empty()) {
            throw ConfigurationError("Route with an empty purpose tag");
        }
        if (!route.handler) {
            throw ConfigurationError("Route " + route.tag + " has no handler");
        }
        const std::string tag = route.tag;
        if (!routes_.emplace(tag, std::move(route)).second) {
            throw ConfigurationError("Purpose " + tag + " registered twice");
        }
        Logger::getInstance().debug("Registered purpose " + tag);
    }
}

const PurposeRoute* DispatchRegistry::find(const std::string& tag) const {
    auto it = routes_.find(tag);
    return it == routes_.end() ? nullptr : &it->second;
}

bool DispatchRegistry::contains(const std::string& tag) const {
    return routes_.count(tag) > 0;
}

std::vector<std::string> DispatchRegistry::tags() const {
    std::vector<std::string> out;
    out.reserve(routes_.size());
    for (const auto& entry : routes_) {
        out.push_back(entry.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace wordbase
