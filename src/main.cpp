#include "concurrency/maintenance_scheduler.hpp"
#include "concurrency/user_lock_table.hpp"
#include "config/app_config.hpp"
#include "database/connection_pool.hpp"
#include "database/db_manager.hpp"
#include "messaging/message_consumer.hpp"
#include "messaging/pg_queue_broker.hpp"
#include "messaging/purpose_handlers.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <exception>
#include <memory>
#include <string>

namespace {

void configureLogging(const wordbase::AppConfig& config) {
    auto& logger = wordbase::Logger::getInstance();
    logger.setLevel(config.debug ? wordbase::LogLevel::DEBUG : wordbase::Logger::parseLevel(config.log_level));
    if (!config.log_file.empty()) {
        logger.setLogFile(config.log_file);
    }
}

} // namespace

int main() {
    using namespace wordbase;

    AppConfig config;
    try {
        config = AppConfig::fromEnvironment();
    } catch (const ConfigurationError& e) {
        Logger::getInstance().error(std::string("Invalid configuration: ") + e.what());
        return 1;
    }
    configureLogging(config);
    Logger::getInstance().info("Starting wordbase worker...");

    ConnectionPool::Options pool_options;
    pool_options.min_size = config.database.pool_min_size;
    pool_options.max_size = config.database.pool_max_size;
    pool_options.acquire_timeout = config.database.pool_timeout;
    ConnectionPool pool(ConnectionPool::makePostgresFactory(config.database), pool_options);

    UserLockTable locks;
    DatabaseManager db(pool, locks);

    PgQueueBroker::Options broker_options;
    broker_options.poll_interval = config.queue.poll_interval;
    PgQueueBroker broker(pool, broker_options);

    try {
        pool.initialize();
        db.initialize();
        broker.declareQueue(config.queue.name);
    } catch (const Error& e) {
        Logger::getInstance().error(std::string("Startup failed (") + errorKindToString(e.kind()) + "): " + e.what());
        return 1;
    }

    std::unique_ptr<DispatchRegistry> registry;
    try {
        registry = std::make_unique<DispatchRegistry>(buildDispatchRegistry(db, config.trial));
    } catch (const ConfigurationError& e) {
        Logger::getInstance().error(std::string("Invalid dispatch table: ") + e.what());
        return 1;
    }

    MessageConsumer::Options consumer_options;
    consumer_options.queue = config.queue.name;
    consumer_options.workers = config.queue.consumer_workers;
    consumer_options.poll_timeout = config.queue.consume_timeout;
    MessageConsumer consumer(broker, *registry, consumer_options);

    boost::asio::io_context io;
    MaintenanceScheduler maintenance(io, locks, config.lock_cleanup_interval);
    maintenance.addTask("stale queue claims", [&broker, &config]() {
        broker.purgeStale(config.queue.name);
    });

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        Logger::getInstance().info("Signal " + std::to_string(signal_number) + " received, shutting down...");
        maintenance.stop();
        consumer.stop();
        io.stop();
    });

    consumer.start();
    maintenance.start();
    Logger::getInstance().info("wordbase worker ready on queue " + config.queue.name);

    io.run();

    consumer.stop();
    pool.close();
    Logger::getInstance().info("wordbase worker stopped");
    return 0;
}
