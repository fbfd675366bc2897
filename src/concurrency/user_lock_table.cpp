#include "concurrency/user_lock_table.hpp"
#include <utility>

namespace wordbase {

UserLockTable::Guard::Guard(UserLockTable* table, int64_t user_id, std::shared_ptr<Slot> slot)
    : table_(table), user_id_(user_id), slot_(std::move(slot)) {
}

UserLockTable::Guard::~Guard() {
    unlock();
}

UserLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), user_id_(other.user_id_), slot_(std::move(other.slot_)) {
    other.table_ = nullptr;
}

UserLockTable::Guard& UserLockTable::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        unlock();
        table_ = other.table_;
        user_id_ = other.user_id_;
        slot_ = std::move(other.slot_);
        other.table_ = nullptr;
    }
    return *this;
}

void UserLockTable::Guard::unlock() {
    if (!slot_) {
        return;
    }
    slot_->mutex.unlock();
    table_->releaseRef(user_id_);
    slot_.reset();
    table_ = nullptr;
}

UserLockTable::Guard UserLockTable::lockUser(int64_t user_id) {
    std::shared_ptr<Slot> slot = retain(user_id);
    slot->mutex.lock();
    return Guard(this, user_id, std::move(slot));
}

UserLockTable::Guard UserLockTable::tryLockUser(int64_t user_id) {
    std::shared_ptr<Slot> slot = retain(user_id);
    if (!slot->mutex.try_lock()) {
        releaseRef(user_id);
        return Guard();
    }
    return Guard(this, user_id, std::move(slot));
}

std::unique_lock<std::mutex> UserLockTable::lockStats() {
    return std::unique_lock<std::mutex>(stats_mutex_);
}

size_t UserLockTable::purgeIdle() {
    std::lock_guard<std::mutex> lock(table_mutex_);
    size_t removed = 0;
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (it->second->refs == 0) {
            it = slots_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t UserLockTable::size() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return slots_.size();
}

std::shared_ptr<UserLockTable::Slot> UserLockTable::retain(int64_t user_id) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    std::shared_ptr<Slot>& slot = slots_[user_id];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    slot->refs++;
    return slot;
}

void UserLockTable::releaseRef(int64_t user_id) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = slots_.find(user_id);
    if (it != slots_.end() && it->second->refs > 0) {
        it->second->refs--;
    }
}

} // namespace wordbase
