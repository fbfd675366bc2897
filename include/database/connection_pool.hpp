#ifndef WORDBASE_CONNECTION_POOL_HPP
#define WORDBASE_CONNECTION_POOL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include "database/db_connection.hpp"

namespace wordbase {

class ConnectionPool;

/**
 * Scoped lease on a pooled connection. Returns the connection to its pool when
 * destroyed, whichever way the owning scope is left.
 */
class PooledConnection {
public:
    PooledConnection() = default;
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    DatabaseConnection* operator->() const { return conn_.get(); }
    DatabaseConnection& operator*() const { return *conn_; }
    explicit operator bool() const { return conn_ != nullptr; }

    void release();

private:
    friend class ConnectionPool;
    PooledConnection(ConnectionPool* pool, std::unique_ptr<DatabaseConnection> conn, uint64_t generation);

    ConnectionPool* pool_ = nullptr;
    std::unique_ptr<DatabaseConnection> conn_;
    uint64_t generation_ = 0;
};

/**
 * Bounded pool of PostgreSQL connections. The only place that opens physical
 * connections; everything else leases them through acquire().
 */
class ConnectionPool {
public:
    // Opens one connection or throws ConnectivityError
    using ConnectionFactory = std::function<std::unique_ptr<DatabaseConnection>()>;
    // Runs once per connection before its first lease (statement preparation)
    using ConnectionInitializer = std::function<void(DatabaseConnection&)>;

    struct Options {
        size_t min_size = 5;
        size_t max_size = 20;
        std::chrono::milliseconds acquire_timeout{60000};
    };

    ConnectionPool(ConnectionFactory factory, Options options);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Opens min_size connections up front
    void initialize();
    void setInitializer(ConnectionInitializer initializer);

    // Blocks up to acquire_timeout, then throws ConnectivityError
    PooledConnection acquire();

    // Drops idle connections and fails every later acquire()
    void close();

    size_t idleCount() const;
    size_t totalCount() const;
    size_t inUseCount() const;
    const Options& options() const { return options_; }

    static ConnectionFactory makePostgresFactory(const DatabaseSettings& settings);

private:
    friend class PooledConnection;

    struct IdleEntry {
        std::unique_ptr<DatabaseConnection> conn;
        uint64_t generation;
    };

    void release(std::unique_ptr<DatabaseConnection> conn, uint64_t generation);
    PooledConnection prepareLease(std::unique_ptr<DatabaseConnection> conn, uint64_t generation);
    std::unique_ptr<DatabaseConnection> openSlot();

    ConnectionFactory factory_;
    ConnectionInitializer initializer_;
    Options options_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<IdleEntry> idle_;
    size_t total_ = 0;
    uint64_t generation_ = 0;
    bool closed_ = false;
};

} // namespace wordbase

#endif // WORDBASE_CONNECTION_POOL_HPP
