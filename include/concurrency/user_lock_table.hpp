#ifndef WORDBASE_USER_LOCK_TABLE_HPP
#define WORDBASE_USER_LOCK_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace wordbase {

/**
 * Per-user mutual exclusion plus one global statistics mutex.
 *
 * A slot is created the first time a user key is locked. Every holder or
 * waiter is counted on the slot before it blocks, so purgeIdle() only ever
 * removes slots nobody references and two callers for the same key always
 * meet on the same mutex.
 */
class UserLockTable {
    struct Slot {
        std::mutex mutex;
        size_t refs = 0;
    };

public:
    // Holds one user's lock until destroyed
    class Guard {
    public:
        Guard() = default;
        ~Guard();

        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool ownsLock() const { return slot_ != nullptr; }
        int64_t userId() const { return user_id_; }
        void unlock();

    private:
        friend class UserLockTable;
        Guard(UserLockTable* table, int64_t user_id, std::shared_ptr<Slot> slot);

        UserLockTable* table_ = nullptr;
        int64_t user_id_ = 0;
        std::shared_ptr<Slot> slot_;
    };

    UserLockTable() = default;
    UserLockTable(const UserLockTable&) = delete;
    UserLockTable& operator=(const UserLockTable&) = delete;

    Guard lockUser(int64_t user_id);
    // Returns an empty guard when another caller holds the user's lock
    Guard tryLockUser(int64_t user_id);

    std::unique_lock<std::mutex> lockStats();

    // Removes slots with no holder and no waiter, returns how many were removed
    size_t purgeIdle();
    size_t size() const;

private:
    std::shared_ptr<Slot> retain(int64_t user_id);
    void releaseRef(int64_t user_id);

    mutable std::mutex table_mutex_;
    std::unordered_map<int64_t, std::shared_ptr<Slot>> slots_;
    std::mutex stats_mutex_;
};

} // namespace wordbase

#endif // WORDBASE_USER_LOCK_TABLE_HPP
