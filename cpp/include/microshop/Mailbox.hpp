/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace microshop {

/**
 * Mailbox - unbounded blocking FIFO owned by one actor
 *
 * Any number of producers, one consumer. pop() blocks until an item is
 * available and reports whether it was the last queued item.
 *
 * seal() closes the mailbox to further push() calls and appends trailing
 * items (the lifecycle signals) in the same critical section, so nothing
 * pushed by a producer can land after them.
 */
template <typename T>
class Mailbox {
public:
    Mailbox() = default;
    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    /**
     * Enqueue an item.
     * @return false if the mailbox is sealed; the item is not enqueued
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (sealed_)
                return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * Seal the mailbox and append the trailing items.
     * @return false if it was already sealed
     */
    bool seal(std::vector<T> trailing) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (sealed_)
                return false;
            sealed_ = true;
            for (auto& item : trailing)
                items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /// Blocking pop. Returns the item and whether the queue is now empty.
    std::pair<T, bool> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty(); });
        T item = std::move(items_.front());
        items_.pop_front();
        return {std::move(item), items_.empty()};
    }

    bool is_empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    std::size_t length() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool is_sealed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sealed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool sealed_ = false;
};

} // namespace microshop
