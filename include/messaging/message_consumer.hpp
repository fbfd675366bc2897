#ifndef WORDBASE_MESSAGE_CONSUMER_HPP
#define WORDBASE_MESSAGE_CONSUMER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include "messaging/dispatch_registry.hpp"
#include "messaging/message_broker.hpp"

namespace wordbase {

/**
 * Pulls deliveries from one queue and dispatches them by purpose.
 *
 * Every delivery is acknowledged exactly once whatever happens to it: a
 * malformed body, an unknown purpose and a throwing handler are all logged
 * and acked. Nothing is redelivered.
 */
class MessageConsumer {
public:
    enum class Outcome {
        Idle,       // nothing arrived within the timeout
        Dropped,    // malformed or unroutable, acked without side effects
        Succeeded,
        Failed      // handler threw, acked anyway
    };

    struct Options {
        std::string queue = "new_users";
        size_t workers = 4;
        std::chrono::milliseconds poll_timeout{1000};
        std::chrono::milliseconds error_backoff{1000};
    };

    MessageConsumer(MessageBroker& broker, const DispatchRegistry& registry, Options options);
    ~MessageConsumer();

    MessageConsumer(const MessageConsumer&) = delete;
    MessageConsumer& operator=(const MessageConsumer&) = delete;

    void start();
    // Lets in-flight messages finish and be acked, then joins the workers
    void stop();
    bool isRunning() const { return running_; }

    Outcome processNext(std::chrono::milliseconds timeout);
    Outcome handleDelivery(const Delivery& delivery);

    uint64_t succeededCount() const { return succeeded_; }
    uint64_t failedCount() const { return failed_; }
    uint64_t droppedCount() const { return dropped_; }

private:
    void workerLoop(size_t index);

    MessageBroker& broker_;
    const DispatchRegistry& registry_;
    Options options_;

    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;

    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
};

const char* outcomeToString(MessageConsumer::Outcome outcome);

} // namespace wordbase

#endif // WORDBASE_MESSAGE_CONSUMER_HPP
