#ifndef WORDBASE_PG_QUEUE_BROKER_HPP
#define WORDBASE_PG_QUEUE_BROKER_HPP

#include <chrono>
#include <mutex>
#include <unordered_set>
#include "database/connection_pool.hpp"
#include "messaging/message_broker.hpp"

namespace wordbase {

/**
 * Durable queue kept in the message_queue table.
 *
 * fetch() claims the oldest undelivered row with FOR UPDATE SKIP LOCKED and
 * stamps delivered_at; ack() deletes it. Rows that were claimed but never
 * acked (the worker died, or the DELETE failed) are dropped by purgeStale()
 * once older than stale_after, so a message is handled at most once.
 * declareQueue() runs one purge; the maintenance scheduler runs the rest.
 */
class PgQueueBroker : public MessageBroker {
public:
    struct Options {
        std::chrono::milliseconds poll_interval{200};
        std::chrono::seconds stale_after{300};
    };

    PgQueueBroker(ConnectionPool& pool, Options options);

    void declareQueue(const std::string& queue) override;
    void publish(const std::string& queue, const std::string& body) override;
    std::optional<Delivery> fetch(const std::string& queue, std::chrono::milliseconds timeout) override;
    void ack(uint64_t tag) override;
    size_t unackedCount() const override;

    // Deletes rows of this queue claimed more than stale_after ago, returns how many
    size_t purgeStale(const std::string& queue);

private:
    std::optional<Delivery> claimNext(const std::string& queue);

    ConnectionPool& pool_;
    Options options_;

    mutable std::mutex mutex_;
    std::unordered_set<uint64_t> unacked_;
};

} // namespace wordbase

#endif // WORDBASE_PG_QUEUE_BROKER_HPP
