#include <catch2/catch.hpp>
#include "concurrency/maintenance_scheduler.hpp"
#include "concurrency/user_lock_table.hpp"
#include <stdexcept>

using namespace wordbase;
using namespace std::chrono_literals;

TEST_CASE("idle lock slots are purged periodically", "[maintenance]") {
    boost::asio::io_context io;
    UserLockTable locks;
    for (int64_t id = 1; id <= 5; ++id) {
        locks.lockUser(id);
    }
    auto held = locks.lockUser(42);
    REQUIRE(locks.size() == 6);

    MaintenanceScheduler scheduler(io, locks, 10ms);
    scheduler.start();
    io.run_for(100ms);

    CHECK(scheduler.passes() > 0);
    CHECK(locks.size() == 1);
    CHECK(held.ownsLock());
    scheduler.stop();
}

TEST_CASE("stop cancels the pending pass", "[maintenance]") {
    boost::asio::io_context io;
    UserLockTable locks;
    locks.lockUser(7);

    MaintenanceScheduler scheduler(io, locks, 50ms);
    scheduler.start();
    scheduler.stop();
    io.run_for(100ms);

    CHECK(scheduler.passes() == 0);
    CHECK(locks.size() == 1);
}

TEST_CASE("housekeeping tasks run on every pass", "[maintenance]") {
    boost::asio::io_context io;
    UserLockTable locks;
    int runs = 0;
    int after_failure = 0;

    MaintenanceScheduler scheduler(io, locks, 10ms);
    scheduler.addTask("counter", [&runs]() { runs++; });
    scheduler.addTask("broken", []() { throw std::runtime_error("store unreachable"); });
    scheduler.addTask("after broken", [&after_failure]() { after_failure++; });
    scheduler.start();
    io.run_for(100ms);
    scheduler.stop();

    REQUIRE(scheduler.passes() > 1);
    CHECK(static_cast<size_t>(runs) == scheduler.passes());
    CHECK(static_cast<size_t>(after_failure) == scheduler.passes());
}
