/**
 * @file mailbox.hpp
 * @brief Unbounded blocking message queue between threads
 *
 * Workers receive serialized commands through a Mailbox and the scheduler
 * receives serialized worker messages through its own. Close() wakes every
 * waiter; after closing, Push() is rejected and pops drain what is left.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace auditlens {
namespace core {

template <typename T>
class Mailbox {
public:
    Mailbox() = default;

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    /**
     * @brief Enqueue a message
     * @return false if the mailbox is closed (message dropped)
     */
    bool Push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Block until a message arrives or the mailbox is closed and drained
     */
    std::optional<T> Pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
        return TakeFront();
    }

    /**
     * @brief Block until a message arrives, the deadline passes, or close
     * @return Message, or std::nullopt on timeout / closed and drained
     */
    template <typename Clock, typename Duration>
    std::optional<T> PopUntil(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_until(lock, deadline, [this]() { return closed_ || !queue_.empty(); });
        return TakeFront();
    }

    template <typename Rep, typename Period>
    std::optional<T> PopFor(const std::chrono::duration<Rep, Period>& timeout) {
        return PopUntil(std::chrono::steady_clock::now() + timeout);
    }

    void Close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
    }

    bool Closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    // Caller holds mutex_
    std::optional<T> TakeFront() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(queue_.front()));
        queue_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    bool closed_{false};
};

} // namespace core
} // namespace auditlens
