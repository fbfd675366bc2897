#ifndef WORDBASE_DISPATCH_REGISTRY_HPP
#define WORDBASE_DISPATCH_REGISTRY_HPP

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wordbase {

// Receives the payload JSON; reports failure by throwing
using PurposeHandler = std::function<void(const std::string& payload)>;

struct PurposeRoute {
    std::string tag;
    std::string payload_key;
    PurposeHandler handler;
};

/**
 * Immutable purpose-tag to route table, built once at startup.
 * A repeated tag or a route without a handler throws ConfigurationError.
 */
class DispatchRegistry {
public:
    explicit DispatchRegistry(std::vector<PurposeRoute> routes);

    // nullptr when the tag has no route
    const PurposeRoute* find(const std::string& tag) const;
    bool contains(const std::string& tag) const;
    size_t size() const { return routes_.size(); }
    std::vector<std::string> tags() const;

private:
    std::unordered_map<std::string, PurposeRoute> routes_;
};

} // namespace wordbase

#endif // WORDBASE_DISPATCH_REGISTRY_HPP
