#ifndef WORDBASE_IN_MEMORY_BROKER_HPP
#define WORDBASE_IN_MEMORY_BROKER_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <unordered_map>
#include "messaging/message_broker.hpp"

namespace wordbase {

/**
 * Thread-safe in-process broker with the same ack bookkeeping as the durable
 * one. Messages do not survive the process.
 */
class InMemoryBroker : public MessageBroker {
public:
    InMemoryBroker() = default;

    void declareQueue(const std::string& queue) override;
    void publish(const std::string& queue, const std::string& body) override;
    std::optional<Delivery> fetch(const std::string& queue, std::chrono::milliseconds timeout) override;
    void ack(uint64_t tag) override;
    size_t unackedCount() const override;

    size_t pendingCount(const std::string& queue) const;
    uint64_t ackedCount() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable arrived_;
    std::unordered_map<std::string, std::deque<std::string>> queues_;
    std::unordered_map<uint64_t, Delivery> unacked_;
    uint64_t next_tag_ = 1;
    uint64_t acked_ = 0;
};

} // namespace wordbase

#endif // WORDBASE_IN_MEMORY_BROKER_HPP
