/**
 * @file task_queue.hpp
 * @brief Priority-ordered pending task queue
 *
 * Owned and mutated by the scheduler thread only.
 *
 * @date 2025
 */

#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "auditlens/core/task.hpp"

namespace auditlens {
namespace core {

/**
 * @class TaskQueue
 * @brief Tasks sorted by priority tier, FIFO within a tier
 *
 * Push() appends and re-sorts the whole queue with a stable sort on the
 * priority rank, so submission order is preserved inside each tier.
 * PushFront() puts a task back at the head regardless of tier; it is used to
 * return a task whose delivery to a worker failed.
 */
class TaskQueue {
public:
    void Push(Task task);
    void PushFront(Task task);

    /// Remove and return the head task, or std::nullopt if empty
    std::optional<Task> PopFront();

    const Task* Front() const;

    bool Empty() const { return tasks_.empty(); }
    std::size_t Size() const { return tasks_.size(); }

    /// Task ids in dispatch order
    std::vector<std::string> Ids() const;

    void Clear() { tasks_.clear(); }

private:
    std::deque<Task> tasks_;
};

} // namespace core
} // namespace auditlens
