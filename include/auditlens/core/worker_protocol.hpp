/**
 * @file worker_protocol.hpp
 * @brief Message protocol between the scheduler and its workers
 *
 * Every message crosses the thread boundary as a serialized JSON document,
 * so workers and the scheduler never share mutable objects.
 *
 * **Scheduler to worker**:
 * ```
 * {"type": "process_task", "task": {id, kind, payload, priority, createdAt}}
 * ```
 *
 * **Worker to scheduler** (discriminated by `type`):
 * ```
 * {"type": "started",   "taskId": ...}
 * {"type": "progress",  "taskId": ..., "percent": 0..100, "message": ...}
 * {"type": "completed", "taskId": ..., "result": {...}}
 * {"type": "failed",    "taskId": ..., "error": {"message": ..., "detail": ...}}
 * {"type": "ready"}
 * {"type": "exited",    "code": ..., "reason": ...}
 * ```
 *
 * Worker messages travel inside an envelope naming the sending slot and the
 * worker generation, so the scheduler can discard messages from a worker it
 * already replaced: `{"workerId": 0, "generation": 1, "message": {...}}`.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "auditlens/core/task.hpp"

namespace auditlens {
namespace core {

struct TaskStarted {
    std::string task_id;
};

struct TaskProgress {
    std::string task_id;
    int percent{0};
    std::string message;
};

struct TaskCompleted {
    std::string task_id;
    nlohmann::json result;
};

struct TaskFailed {
    std::string task_id;
    TaskError error;
};

struct WorkerReady {};

struct WorkerExited {
    int code{1};
    std::string reason;
};

using WorkerMessage = std::variant<TaskStarted, TaskProgress, TaskCompleted,
                                   TaskFailed, WorkerReady, WorkerExited>;

/**
 * @struct WorkerEnvelope
 * @brief Worker message tagged with its sender
 */
struct WorkerEnvelope {
    std::size_t worker_id{0};
    std::uint64_t generation{0};
    WorkerMessage message;
};

class WorkerProtocol {
public:
    /***************************************************************************
     * Commands
     ***************************************************************************/

    static std::string EncodeProcessTask(const Task& task);

    /**
     * @brief Decode a `process_task` command
     * @throws std::invalid_argument on malformed or unknown commands
     */
    static Task DecodeProcessTask(const std::string& serialized);

    /***************************************************************************
     * Worker messages
     ***************************************************************************/

    static nlohmann::json ToJson(const WorkerMessage& message);

    /**
     * @throws std::invalid_argument on unknown `type` or missing fields
     */
    static WorkerMessage FromJson(const nlohmann::json& j);

    static std::string EncodeEnvelope(const WorkerEnvelope& envelope);

    /**
     * @throws std::invalid_argument if the document is not a valid envelope
     */
    static WorkerEnvelope DecodeEnvelope(const std::string& serialized);

    /// Wire `type` of a message ("started", "progress", ...)
    static std::string TypeName(const WorkerMessage& message);
};

} // namespace core
} // namespace auditlens
