#include "concurrency/maintenance_scheduler.hpp"
#include "concurrency/user_lock_table.hpp"
#include "utils/logger.hpp"
#include <exception>
#include <utility>

namespace wordbase {

MaintenanceScheduler::MaintenanceScheduler(boost::asio::io_context& io, UserLockTable& locks,
                                           std::chrono::milliseconds interval)
    : timer_(io), locks_(locks), interval_(interval) {
}

MaintenanceScheduler::~MaintenanceScheduler() {
    stop();
}

void MaintenanceScheduler::addTask(std::string name, Task task) {
    tasks_.push_back(NamedTask{std::move(name), std::move(task)});
}

void MaintenanceScheduler::start() {
    if (running_.exchange(true)) return;
    Logger::getInstance().info("MaintenanceScheduler started, lock cleanup every " +
                               std::to_string(interval_.count()) + " ms");
    schedule();
}

void MaintenanceScheduler::stop() {
    if (!running_.exchange(false)) return;
    timer_.cancel();
    Logger::getInstance().info("MaintenanceScheduler stopped");
}

void MaintenanceScheduler::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
        }
        if (ec) {
            Logger::getInstance().warning("MaintenanceScheduler timer error: " + ec.message());
        } else {
            runPass();
        }
        schedule();
    });
}

void MaintenanceScheduler::runPass() {
    const size_t removed = locks_.purgeIdle();
    if (removed > 0) {
        Logger::getInstance().debug("Lock cleanup removed " + std::to_string(removed) +
                                    " idle user locks, " + std::to_string(locks_.size()) + " remain");
    }

    for (const auto& entry : tasks_) {
        try {
            entry.task();
        } catch (const std::exception& e) {
            Logger::getInstance().warning("Maintenance task '" + entry.name + "' failed: " + e.what());
        }
    }
    passes_++;
}

} // namespace wordbase
