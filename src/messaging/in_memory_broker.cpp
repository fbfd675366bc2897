#include "messaging/in_memory_broker.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace wordbase {

void InMemoryBroker::declareQueue(const std::string& queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_[queue];
}

void InMemoryBroker::publish(const std::string& queue, const std::string& body) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queues_.find(queue);
        if (it == queues_.end()) {
            throw ConfigurationError("Queue '" + queue + "' was not declared");
        }
        it->second.push_back(body);
    }
    arrived_.notify_all();
}

std::optional<Delivery> InMemoryBroker::fetch(const std::string& queue, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = queues_.find(queue);
    if (it == queues_.end()) {
        throw ConfigurationError("Queue '" + queue + "' was not declared");
    }

    // unordered_map references stay valid across inserts of other queues
    std::deque<std::string>& pending = it->second;
    if (!arrived_.wait_for(lock, timeout, [&pending] { return !pending.empty(); })) {
        return std::nullopt;
    }

    Delivery delivery;
    delivery.tag = next_tag_++;
    delivery.queue = queue;
    delivery.body = std::move(pending.front());
    pending.pop_front();
    unacked_.emplace(delivery.tag, delivery);
    return delivery;
}

void InMemoryBroker::ack(uint64_t tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unacked_.erase(tag) == 0) {
        Logger::getInstance().warning("Ack for unknown delivery tag " + std::to_string(tag));
        return;
    }
    acked_++;
}

size_t InMemoryBroker::unackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unacked_.size();
}

size_t InMemoryBroker::pendingCount(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(queue);
    return it == queues_.end() ? 0 : it->second.size();
}

uint64_t InMemoryBroker::ackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acked_;
}

} // namespace wordbase
