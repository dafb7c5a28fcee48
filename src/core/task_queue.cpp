/**
 * @file task_queue.cpp
 * @brief Implementation of the priority task queue
 *
 * @date 2025
 */

#include "auditlens/core/task_queue.hpp"

#include <algorithm>

namespace auditlens {
namespace core {

void TaskQueue::Push(Task task) {
    tasks_.push_back(std::move(task));
    std::stable_sort(tasks_.begin(), tasks_.end(),
                     [](const Task& a, const Task& b) {
                         return PriorityRank(a.priority) < PriorityRank(b.priority);
                     });
}

void TaskQueue::PushFront(Task task) {
    tasks_.push_front(std::move(task));
}

std::optional<Task> TaskQueue::PopFront() {
    if (tasks_.empty()) {
        return std::nullopt;
    }
    Task task = std::move(tasks_.front());
    tasks_.pop_front();
    return task;
}

const Task* TaskQueue::Front() const {
    return tasks_.empty() ? nullptr : &tasks_.front();
}

std::vector<std::string> TaskQueue::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        ids.push_back(task.id);
    }
    return ids;
}

} // namespace core
} // namespace auditlens
