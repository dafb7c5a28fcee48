/**
 * @file job_store.hpp
 * @brief Persistence collaborator receiving task progress and outcomes
 *
 * The scheduler reports every progress update and terminal state of a task
 * to a JobStore. Updates for unknown task ids are no-ops: the record is
 * created by whoever submitted the task.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "auditlens/core/task.hpp"

namespace auditlens {
namespace core {

/**
 * @class JobStore
 * @brief Interface of the job persistence collaborator
 *
 * Implementations must be thread-safe.
 */
class JobStore {
public:
    virtual ~JobStore() = default;

    /**
     * @brief Record progress
     * @param task_id Task identifier
     * @param percent 0..100
     * @param status "running", or "completed" at 100
     */
    virtual void UpdateProgress(const std::string& task_id, int percent,
                                const std::string& status) = 0;

    virtual void MarkCompleted(const std::string& task_id, const nlohmann::json& result) = 0;

    virtual void MarkFailed(const std::string& task_id, const TaskError& error) = 0;
};

/**
 * @enum JobState
 */
enum class JobState {
    QUEUED,
    RUNNING,
    COMPLETED,
    FAILED
};

std::string JobStateToString(JobState state);

/**
 * @struct JobRecord
 * @brief Persisted view of one task
 */
struct JobRecord {
    std::string task_id;
    TaskKind kind{TaskKind::ANALYSIS};
    JobState state{JobState::QUEUED};
    int progress{0};
    std::string status{"queued"};
    nlohmann::json result;
    std::optional<TaskError> error;
    utils::TimePoint updated_at{utils::TimeUtils::Now()};
};

/**
 * @class InMemoryJobStore
 * @brief Thread-safe in-process JobStore for the CLI and tests
 *
 * Completed and failed records are terminal: later updates are ignored.
 */
class InMemoryJobStore : public JobStore {
public:
    /**
     * @brief Create the record of a submitted task
     * @return false if a record with that id already exists
     */
    bool Create(const Task& task);

    void UpdateProgress(const std::string& task_id, int percent,
                        const std::string& status) override;
    void MarkCompleted(const std::string& task_id, const nlohmann::json& result) override;
    void MarkFailed(const std::string& task_id, const TaskError& error) override;

    std::optional<JobRecord> Get(const std::string& task_id) const;
    std::vector<JobRecord> All() const;

    /**
     * @brief Block until every listed task is completed or failed
     * @return false on timeout
     */
    bool WaitForTerminal(const std::vector<std::string>& task_ids,
                         std::chrono::milliseconds timeout) const;

private:
    bool AllTerminal(const std::vector<std::string>& task_ids) const;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::map<std::string, JobRecord> records_;
};

} // namespace core
} // namespace auditlens
