#include "messaging/message_consumer.hpp"
#include "messaging/envelope.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace wordbase {

namespace {

// Acks on scope exit, whichever branch of the dispatch returned or threw
class AckGuard {
public:
    AckGuard(MessageBroker& broker, uint64_t tag) : broker_(broker), tag_(tag) {}
    ~AckGuard() {
        try {
            broker_.ack(tag_);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Failed to ack delivery " + std::to_string(tag_) + ": " + e.what());
        }
    }

    AckGuard(const AckGuard&) = delete;
    AckGuard& operator=(const AckGuard&) = delete;

private:
    MessageBroker& broker_;
    uint64_t tag_;
};

} // namespace

const char* outcomeToString(MessageConsumer::Outcome outcome) {
    switch (outcome) {
        case MessageConsumer::Outcome::Idle: return "idle";
        case MessageConsumer::Outcome::Dropped: return "dropped";
        case MessageConsumer::Outcome::Succeeded: return "succeeded";
        case MessageConsumer::Outcome::Failed: return "failed";
    }
    return "unknown";
}

MessageConsumer::MessageConsumer(MessageBroker& broker, const DispatchRegistry& registry, Options options)
    : broker_(broker), registry_(registry), options_(std::move(options)) {
}

MessageConsumer::~MessageConsumer() {
    stop();
}

void MessageConsumer::start() {
    if (running_.exchange(true)) return;

    const size_t count = std::max<size_t>(1, options_.workers);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this, i]() { workerLoop(i); });
    }
    Logger::getInstance().info("Consuming queue " + options_.queue + " with " + std::to_string(count) + " workers");
}

void MessageConsumer::stop() {
    if (!running_.exchange(false)) return;

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
    Logger::getInstance().info("Consumer stopped: " + std::to_string(succeeded_) + " succeeded, " +
                               std::to_string(failed_) + " failed, " + std::to_string(dropped_) + " dropped");
}

void MessageConsumer::workerLoop(size_t index) {
    Logger::getInstance().debug("Consumer worker " + std::to_string(index) + " started");

    while (running_) {
        try {
            processNext(options_.poll_timeout);
        } catch (const std::exception& e) {
            Logger::getInstance().warning("Consumer worker " + std::to_string(index) + " cannot fetch: " + e.what());
            // Back off in short steps so stop() is not held up
            const auto until = std::chrono::steady_clock::now() + options_.error_backoff;
            while (running_ && std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }
    }

    Logger::getInstance().debug("Consumer worker " + std::to_string(index) + " stopped");
}

MessageConsumer::Outcome MessageConsumer::processNext(std::chrono::milliseconds timeout) {
    std::optional<Delivery> delivery = broker_.fetch(options_.queue, timeout);
    if (!delivery) {
        return Outcome::Idle;
    }
    return handleDelivery(*delivery);
}

MessageConsumer::Outcome MessageConsumer::handleDelivery(const Delivery& delivery) {
    AckGuard ack(broker_, delivery.tag);

    Envelope envelope;
    try {
        envelope = decodeEnvelope(delivery.body);
    } catch (const ValidationError& e) {
        Logger::getInstance().warning("Dropping malformed message " + std::to_string(delivery.tag) + ": " + e.what());
        dropped_++;
        return Outcome::Dropped;
    }

    const PurposeRoute* route = registry_.find(envelope.purpose);
    if (!route) {
        Logger::getInstance().warning("No handler for purpose " + envelope.purpose + ", message " +
                                      std::to_string(delivery.tag) + " dropped");
        dropped_++;
        return Outcome::Dropped;
    }

    const auto payload = envelope.member(route->payload_key);
    if (!payload) {
        Logger::getInstance().warning("Message " + std::to_string(delivery.tag) + " with purpose " +
                                      envelope.purpose + " has no '" + route->payload_key + "' member, dropped");
        dropped_++;
        return Outcome::Dropped;
    }

    try {
        route->handler(*payload);
    } catch (const Error& e) {
        Logger::getInstance().error("Handler for " + envelope.purpose + " failed (" +
                                    errorKindToString(e.kind()) + "): " + e.what());
        failed_++;
        return Outcome::Failed;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Handler for " + envelope.purpose + " failed: " + e.what());
        failed_++;
        return Outcome::Failed;
    }

    Logger::getInstance().debug("Message " + std::to_string(delivery.tag) + " (" + envelope.purpose + ") processed");
    succeeded_++;
    return Outcome::Succeeded;
}

} // namespace wordbase
