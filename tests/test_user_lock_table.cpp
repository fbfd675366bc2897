#include <catch2/catch.hpp>
#include "concurrency/user_lock_table.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace wordbase;

TEST_CASE("first lock materializes a slot", "[user_lock_table]") {
    UserLockTable locks;
    CHECK(locks.size() == 0);
    {
        auto guard = locks.lockUser(42);
        CHECK(guard.ownsLock());
        CHECK(guard.userId() == 42);
        CHECK(locks.size() == 1);
    }
    CHECK(locks.size() == 1);
    CHECK(locks.purgeIdle() == 1);
    CHECK(locks.size() == 0);
}

TEST_CASE("a held lock excludes the same user only", "[user_lock_table]") {
    UserLockTable locks;
    auto held = locks.lockUser(1);

    auto same = locks.tryLockUser(1);
    CHECK_FALSE(same.ownsLock());

    auto other = locks.tryLockUser(2);
    CHECK(other.ownsLock());

    held.unlock();
    auto again = locks.tryLockUser(1);
    CHECK(again.ownsLock());
}

TEST_CASE("purge keeps slots that are held or waited on", "[user_lock_table]") {
    UserLockTable locks;
    auto held = locks.lockUser(7);
    { auto idle = locks.lockUser(8); }

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto g = locks.lockUser(7);
        acquired = true;
    });

    // Give the waiter time to register on the slot
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK(locks.purgeIdle() == 1);
    CHECK(locks.size() == 1);
    CHECK_FALSE(acquired);

    held.unlock();
    waiter.join();
    CHECK(acquired);
    CHECK(locks.purgeIdle() == 1);
    CHECK(locks.size() == 0);
}

TEST_CASE("concurrent holders of one user never overlap", "[user_lock_table]") {
    UserLockTable locks;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<bool> stop_purging{false};

    std::thread purger([&] {
        while (!stop_purging) {
            locks.purgeIdle();
            std::this_thread::yield();
        }
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                auto g = locks.lockUser(5);
                const int now = ++inside;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                }
                --inside;
            }
        });
    }
    for (auto& t : threads) t.join();
    stop_purging = true;
    purger.join();

    CHECK(max_inside == 1);
}

TEST_CASE("moved guard keeps the lock", "[user_lock_table]") {
    UserLockTable locks;
    UserLockTable::Guard outer;
    {
        auto inner = locks.lockUser(3);
        outer = std::move(inner);
        CHECK_FALSE(inner.ownsLock());
    }
    CHECK(outer.ownsLock());
    CHECK_FALSE(locks.tryLockUser(3).ownsLock());
}

TEST_CASE("stats lock is a single global mutex", "[user_lock_table]") {
    UserLockTable locks;
    auto first = locks.lockStats();
    CHECK(first.owns_lock());

    std::atomic<bool> second_acquired{false};
    std::thread other([&] {
        auto second = locks.lockStats();
        second_acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK_FALSE(second_acquired);
    first.unlock();
    other.join();
    CHECK(second_acquired);
}
