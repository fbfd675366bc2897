#ifndef WORDBASE_MESSAGE_BROKER_HPP
#define WORDBASE_MESSAGE_BROKER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace wordbase {

struct Delivery {
    uint64_t tag = 0;
    std::string queue;
    std::string body;
};

/**
 * Durable queue transport. A fetched delivery stays unacknowledged until
 * ack() is called with its tag; the consumer acks every delivery exactly once.
 */
class MessageBroker {
public:
    virtual ~MessageBroker() = default;

    virtual void declareQueue(const std::string& queue) = 0;
    virtual void publish(const std::string& queue, const std::string& body) = 0;
    // Waits up to timeout for the next message, empty if none arrived
    virtual std::optional<Delivery> fetch(const std::string& queue, std::chrono::milliseconds timeout) = 0;
    virtual void ack(uint64_t tag) = 0;
    virtual size_t unackedCount() const = 0;
};

} // namespace wordbase

#endif // WORDBASE_MESSAGE_BROKER_HPP
