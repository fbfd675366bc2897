#include "messaging/pg_queue_broker.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <thread>

namespace wordbase {

namespace {

const char* const kCreateQueueTable =
    "CREATE TABLE IF NOT EXISTS message_queue ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  queue VARCHAR(100) NOT NULL,"
    "  body TEXT NOT NULL,"
    "  enqueued_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  delivered_at TIMESTAMPTZ"
    ")";

const char* const kCreateQueueIndex =
    "CREATE INDEX IF NOT EXISTS idx_message_queue_pending "
    "ON message_queue (queue, id) WHERE delivered_at IS NULL";

const char* const kDropStale =
    "DELETE FROM message_queue "
    "WHERE queue = $1 AND delivered_at IS NOT NULL "
    "AND delivered_at < now() - make_interval(secs => $2::int)";

const char* const kEnqueue =
    "INSERT INTO message_queue (queue, body) VALUES ($1, $2)";

const char* const kClaim =
    "UPDATE message_queue SET delivered_at = now() "
    "WHERE id = ("
    "  SELECT id FROM message_queue "
    "  WHERE queue = $1 AND delivered_at IS NULL "
    "  ORDER BY id "
    "  FOR UPDATE SKIP LOCKED "
    "  LIMIT 1"
    ") RETURNING id, body";

const char* const kAck = "DELETE FROM message_queue WHERE id = $1";

} // namespace

PgQueueBroker::PgQueueBroker(ConnectionPool& pool, Options options)
    : pool_(pool), options_(options) {
}

void PgQueueBroker::declareQueue(const std::string& queue) {
    {
        PooledConnection conn = pool_.acquire();
        conn->executeQuery(kCreateQueueTable);
        conn->executeQuery(kCreateQueueIndex);
    }
    purgeStale(queue);
    Logger::getInstance().info("Queue " + queue + " declared");
}

size_t PgQueueBroker::purgeStale(const std::string& queue) {
    const std::string stale_seconds = std::to_string(options_.stale_after.count());
    const char* params[2] = {queue.c_str(), stale_seconds.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executeParams(kDropStale, 2, params);

    const char* dropped = PQcmdTuples(res.get());
    const size_t count = dropped && *dropped ? std::strtoull(dropped, nullptr, 10) : 0;
    if (count > 0) {
        Logger::getInstance().warning("Dropped " + std::to_string(count) + " unacknowledged messages from queue " +
                                      queue + " claimed more than " +
                                      std::to_string(options_.stale_after.count()) + " s ago");
    }
    return count;
}

void PgQueueBroker::publish(const std::string& queue, const std::string& body) {
    const char* params[2] = {queue.c_str(), body.c_str()};
    PooledConnection conn = pool_.acquire();
    conn->executeParams(kEnqueue, 2, params);
}

std::optional<Delivery> PgQueueBroker::fetch(const std::string& queue, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto delivery = claimNext(queue)) {
            return delivery;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(options_.poll_interval, remaining));
    }
}

std::optional<Delivery> PgQueueBroker::claimNext(const std::string& queue) {
    const char* params[1] = {queue.c_str()};
    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executeParams(kClaim, 1, params);
    if (PQntuples(res.get()) == 0) {
        return std::nullopt;
    }

    Delivery delivery;
    delivery.tag = std::strtoull(PQgetvalue(res.get(), 0, 0), nullptr, 10);
    delivery.queue = queue;
    delivery.body = PQgetvalue(res.get(), 0, 1);

    std::lock_guard<std::mutex> lock(mutex_);
    unacked_.insert(delivery.tag);
    return delivery;
}

void PgQueueBroker::ack(uint64_t tag) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        unacked_.erase(tag);
    }
    const std::string id = std::to_string(tag);
    const char* params[1] = {id.c_str()};
    PooledConnection conn = pool_.acquire();
    conn->executeParams(kAck, 1, params);
}

size_t PgQueueBroker::unackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unacked_.size();
}

} // namespace wordbase
