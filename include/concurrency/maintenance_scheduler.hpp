#ifndef WORDBASE_MAINTENANCE_SCHEDULER_HPP
#define WORDBASE_MAINTENANCE_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <boost/asio.hpp>

namespace wordbase {

class UserLockTable;

// Periodically drops idle per-user lock slots on the given io_context, then
// runs any extra housekeeping tasks. A throwing task is logged and skipped.
class MaintenanceScheduler {
public:
    using Task = std::function<void()>;

    MaintenanceScheduler(boost::asio::io_context& io, UserLockTable& locks,
                         std::chrono::milliseconds interval);
    ~MaintenanceScheduler();

    // Only before start()
    void addTask(std::string name, Task task);

    void start();
    void stop();

    // Number of completed cleanup passes
    size_t passes() const { return passes_.load(); }

private:
    void schedule();
    void runPass();

    struct NamedTask {
        std::string name;
        Task task;
    };

    boost::asio::steady_timer timer_;
    UserLockTable& locks_;
    std::chrono::milliseconds interval_;
    std::vector<NamedTask> tasks_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> passes_{0};
};

} // namespace wordbase

#endif // WORDBASE_MAINTENANCE_SCHEDULER_HPP
