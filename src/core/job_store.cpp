/**
 * @file job_store.cpp
 * @brief In-memory job persistence
 *
 * @date 2025
 */

#include "auditlens/core/job_store.hpp"

#include <spdlog/spdlog.h>

namespace auditlens {
namespace core {

std::string JobStateToString(JobState state) {
    switch (state) {
        case JobState::QUEUED:    return "queued";
        case JobState::RUNNING:   return "running";
        case JobState::COMPLETED: return "completed";
        case JobState::FAILED:    return "failed";
    }
    return "queued";
}

namespace {

bool IsTerminal(JobState state) {
    return state == JobState::COMPLETED || state == JobState::FAILED;
}

} // anonymous namespace

bool InMemoryJobStore::Create(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);

    JobRecord record;
    record.task_id = task.id;
    record.kind = task.kind;
    return records_.emplace(task.id, std::move(record)).second;
}

void InMemoryJobStore::UpdateProgress(const std::string& task_id, int percent,
                                      const std::string& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(task_id);
        if (it == records_.end()) {
            spdlog::debug("Progress for unknown job {} ignored", task_id);
            return;
        }
        auto& record = it->second;
        if (IsTerminal(record.state)) {
            return;
        }
        record.progress = percent;
        record.status = status;
        record.state = JobState::RUNNING;
        record.updated_at = utils::TimeUtils::Now();
    }
    changed_.notify_all();
}

void InMemoryJobStore::MarkCompleted(const std::string& task_id, const nlohmann::json& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(task_id);
        if (it == records_.end() || IsTerminal(it->second.state)) {
            return;
        }
        auto& record = it->second;
        record.state = JobState::COMPLETED;
        record.status = "completed";
        record.progress = 100;
        record.result = result;
        record.updated_at = utils::TimeUtils::Now();
    }
    changed_.notify_all();
}

void InMemoryJobStore::MarkFailed(const std::string& task_id, const TaskError& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(task_id);
        if (it == records_.end() || IsTerminal(it->second.state)) {
            return;
        }
        auto& record = it->second;
        record.state = JobState::FAILED;
        record.status = "failed";
        record.error = error;
        record.updated_at = utils::TimeUtils::Now();
    }
    changed_.notify_all();
}

std::optional<JobRecord> InMemoryJobStore::Get(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(task_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<JobRecord> InMemoryJobStore::All() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobRecord> all;
    all.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        all.push_back(record);
    }
    return all;
}

bool InMemoryJobStore::WaitForTerminal(const std::vector<std::string>& task_ids,
                                       std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, timeout, [&]() { return AllTerminal(task_ids); });
}

// Caller holds mutex_
bool InMemoryJobStore::AllTerminal(const std::vector<std::string>& task_ids) const {
    for (const auto& id : task_ids) {
        auto it = records_.find(id);
        if (it == records_.end() || !IsTerminal(it->second.state)) {
            return false;
        }
    }
    return true;
}

} // namespace core
} // namespace auditlens
