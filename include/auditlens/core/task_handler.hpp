/**
 * @file task_handler.hpp
 * @brief Job logic executed inside a worker
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "auditlens/core/task.hpp"

namespace auditlens {
namespace core {

/**
 * @class ProgressReporter
 * @brief Progress channel from a running task back to the scheduler
 */
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    /**
     * @param percent 0..100 (clamped)
     * @param message Human-readable stage description
     */
    virtual void Report(int percent, const std::string& message) = 0;
};

/**
 * @class TaskHandler
 * @brief Executes one task at a time on behalf of a worker
 *
 * Each worker owns its own handler instance. Execute() returns the result
 * payload on success; a thrown std::exception fails the task, anything else
 * terminates the worker.
 */
class TaskHandler {
public:
    virtual ~TaskHandler() = default;

    virtual nlohmann::json Execute(const Task& task, ProgressReporter& progress) = 0;
};

/// Creates the handler of the worker in the given slot
using TaskHandlerFactory = std::function<std::unique_ptr<TaskHandler>(std::size_t worker_id)>;

} // namespace core
} // namespace auditlens
