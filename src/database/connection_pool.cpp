#include "database/connection_pool.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include <utility>

namespace wordbase {

PooledConnection::PooledConnection(ConnectionPool* pool, std::unique_ptr<DatabaseConnection> conn, uint64_t generation)
    : pool_(pool), conn_(std::move(conn)), generation_(generation) {
}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)), generation_(other.generation_) {
    other.pool_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        generation_ = other.generation_;
        other.pool_ = nullptr;
    }
    return *this;
}

void PooledConnection::release() {
    if (pool_ && conn_) {
        pool_->release(std::move(conn_), generation_);
    }
    pool_ = nullptr;
    conn_.reset();
}

ConnectionPool::ConnectionPool(ConnectionFactory factory, Options options)
    : factory_(std::move(factory)), options_(options) {
    if (options_.max_size == 0) {
        throw ConfigurationError("Connection pool max size must be at least 1");
    }
    if (options_.min_size > options_.max_size) {
        throw ConfigurationError("Connection pool min size exceeds max size");
    }
}

ConnectionPool::~ConnectionPool() {
    close();
}

void ConnectionPool::initialize() {
    for (size_t i = 0; i < options_.min_size; i++) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (total_ >= options_.min_size) {
                break;
            }
            total_++;
        }
        std::unique_ptr<DatabaseConnection> conn = openSlot();
        std::lock_guard<std::mutex> lock(mutex_);
        // Generation 0 marks "initializer not yet applied"
        idle_.push_back(IdleEntry{std::move(conn), 0});
    }
    available_.notify_all();
    Logger::getInstance().info("Connection pool initialized with " + std::to_string(totalCount()) +
                               " connections (max " + std::to_string(options_.max_size) + ")");
}

void ConnectionPool::setInitializer(ConnectionInitializer initializer) {
    std::lock_guard<std::mutex> lock(mutex_);
    initializer_ = std::move(initializer);
    generation_++;
}

PooledConnection ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;

    while (true) {
        if (closed_) {
            throw ConnectivityError("Connection pool is closed");
        }
        if (!idle_.empty()) {
            IdleEntry entry = std::move(idle_.front());
            idle_.pop_front();
            lock.unlock();
            return prepareLease(std::move(entry.conn), entry.generation);
        }
        if (total_ < options_.max_size) {
            total_++;
            lock.unlock();
            return prepareLease(openSlot(), 0);
        }
        if (available_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && total_ >= options_.max_size) {
            Logger::getInstance().warning("Connection pool exhausted: all " +
                                          std::to_string(options_.max_size) + " connections busy");
            throw ConnectivityError("Timed out after " + std::to_string(options_.acquire_timeout.count()) +
                                    " ms waiting for a database connection");
        }
    }
}

void ConnectionPool::close() {
    std::deque<IdleEntry> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        total_ -= idle_.size();
        dropped.swap(idle_);
    }
    available_.notify_all();
    if (!dropped.empty()) {
        Logger::getInstance().info("Connection pool closed, " + std::to_string(dropped.size()) +
                                   " idle connections dropped");
    }
}

size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

size_t ConnectionPool::totalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

size_t ConnectionPool::inUseCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_ - idle_.size();
}

ConnectionPool::ConnectionFactory ConnectionPool::makePostgresFactory(const DatabaseSettings& settings) {
    return [settings]() {
        auto conn = std::make_unique<DatabaseConnection>(settings);
        if (!conn->connect()) {
            throw ConnectivityError("Cannot connect to PostgreSQL at " + settings.host + ":" +
                                    settings.port + ": " + conn->getLastError());
        }
        return conn;
    };
}

void ConnectionPool::release(std::unique_ptr<DatabaseConnection> conn, uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !conn || conn->isBroken()) {
            if (conn && conn->isBroken()) {
                Logger::getInstance().warning("Discarding broken database connection");
            }
            total_--;
        } else {
            idle_.push_back(IdleEntry{std::move(conn), generation});
        }
    }
    available_.notify_one();
}

PooledConnection ConnectionPool::prepareLease(std::unique_ptr<DatabaseConnection> conn, uint64_t generation) {
    ConnectionInitializer initializer;
    uint64_t current = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        initializer = initializer_;
        current = generation_;
    }

    // The lease owns the slot from here on, so a throwing initializer still gives it back
    PooledConnection lease(this, std::move(conn), generation);
    if (initializer && generation != current) {
        initializer(*lease);
        lease.generation_ = current;
    }
    return lease;
}

std::unique_ptr<DatabaseConnection> ConnectionPool::openSlot() {
    try {
        std::unique_ptr<DatabaseConnection> conn = factory_();
        if (!conn) {
            throw ConnectivityError("Connection factory returned no connection");
        }
        return conn;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            total_--;
        }
        available_.notify_one();
        throw;
    }
}

} // namespace wordbase
