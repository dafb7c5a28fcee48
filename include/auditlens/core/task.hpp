/**
 * @file task.hpp
 * @brief Schedulable unit of work and its wire representation
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>

#include <nlohmann/json.hpp>

#include "auditlens/utils/time_utils.hpp"

namespace auditlens {
namespace core {

/**
 * @enum TaskKind
 * @brief Job family handled by a worker
 */
enum class TaskKind {
    ANALYSIS,       ///< Run the detection pipeline over extracted audit data
    EXTRACTION      ///< Stage audit data collection (progress-only)
};

/**
 * @enum TaskPriority
 * @brief Dispatch tier; lower rank is dispatched first
 */
enum class TaskPriority {
    CRITICAL = 0,
    HIGH = 1,
    MEDIUM = 2,
    LOW = 3
};

std::string TaskKindToString(TaskKind kind);
std::optional<TaskKind> ParseTaskKind(const std::string& name);

std::string TaskPriorityToString(TaskPriority priority);
std::optional<TaskPriority> ParseTaskPriority(const std::string& name);

/// Dispatch rank: critical 0, high 1, medium 2, low 3
inline int PriorityRank(TaskPriority priority) { return static_cast<int>(priority); }

/**
 * @struct Task
 * @brief Unit of work submitted to the scheduler
 *
 * `id` must be unique over the lifetime of the scheduler. `payload` is
 * job-specific and opaque to the scheduler.
 */
struct Task {
    std::string id;                                     ///< Unique task identifier
    TaskKind kind{TaskKind::ANALYSIS};                  ///< Job family
    nlohmann::json payload = nlohmann::json::object();  ///< Job parameters
    TaskPriority priority{TaskPriority::MEDIUM};        ///< Dispatch tier
    utils::TimePoint created_at{utils::TimeUtils::Now()};  ///< Submission time

    nlohmann::json ToJson() const;

    /**
     * @brief Parse the wire form `{id, kind, payload, priority, createdAt}`
     * @throws std::invalid_argument on missing id or unknown kind/priority
     */
    static Task FromJson(const nlohmann::json& j);
};

/**
 * @struct TaskError
 * @brief Failure description carried by `failed` messages
 */
struct TaskError {
    std::string message;    ///< Human-readable error
    std::string detail;     ///< Exception type or context

    nlohmann::json ToJson() const;
    static TaskError FromJson(const nlohmann::json& j);
};

} // namespace core
} // namespace auditlens
