/**
 * @file worker_protocol.cpp
 * @brief JSON codec of the scheduler/worker protocol
 *
 * @date 2025
 */

#include "auditlens/core/worker_protocol.hpp"

#include <stdexcept>

namespace auditlens {
namespace core {

using json = nlohmann::json;

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string RequireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("Worker message missing string field: ") + key);
    }
    return it->get<std::string>();
}

json ParseDocument(const std::string& serialized) {
    try {
        return json::parse(serialized);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Malformed protocol document: ") + e.what());
    }
}

} // anonymous namespace

// ============================================================================
// COMMANDS
// ============================================================================

std::string WorkerProtocol::EncodeProcessTask(const Task& task) {
    json command = {
        {"type", "process_task"},
        {"task", task.ToJson()}
    };
    return command.dump(-1, ' ', false, json::error_handler_t::replace);
}

Task WorkerProtocol::DecodeProcessTask(const std::string& serialized) {
    json command = ParseDocument(serialized);

    if (!command.is_object() || command.value("type", "") != "process_task") {
        throw std::invalid_argument("Unknown worker command");
    }
    if (!command.contains("task")) {
        throw std::invalid_argument("process_task command without task");
    }
    return Task::FromJson(command["task"]);
}

// ============================================================================
// WORKER MESSAGES
// ============================================================================

json WorkerProtocol::ToJson(const WorkerMessage& message) {
    return std::visit(Overloaded{
        [](const TaskStarted& m) -> json {
            return {{"type", "started"}, {"taskId", m.task_id}};
        },
        [](const TaskProgress& m) -> json {
            return {{"type", "progress"}, {"taskId", m.task_id},
                    {"percent", m.percent}, {"message", m.message}};
        },
        [](const TaskCompleted& m) -> json {
            return {{"type", "completed"}, {"taskId", m.task_id}, {"result", m.result}};
        },
        [](const TaskFailed& m) -> json {
            return {{"type", "failed"}, {"taskId", m.task_id}, {"error", m.error.ToJson()}};
        },
        [](const WorkerReady&) -> json {
            return {{"type", "ready"}};
        },
        [](const WorkerExited& m) -> json {
            return {{"type", "exited"}, {"code", m.code}, {"reason", m.reason}};
        }
    }, message);
}

WorkerMessage WorkerProtocol::FromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Worker message must be an object");
    }

    const std::string type = RequireString(j, "type");

    if (type == "started") {
        return TaskStarted{RequireString(j, "taskId")};
    }
    if (type == "progress") {
        TaskProgress progress;
        progress.task_id = RequireString(j, "taskId");
        progress.percent = j.value("percent", 0);
        progress.message = j.value("message", "");
        return progress;
    }
    if (type == "completed") {
        TaskCompleted completed;
        completed.task_id = RequireString(j, "taskId");
        completed.result = j.value("result", json::object());
        return completed;
    }
    if (type == "failed") {
        TaskFailed failed;
        failed.task_id = RequireString(j, "taskId");
        failed.error = TaskError::FromJson(j.value("error", json::object()));
        return failed;
    }
    if (type == "ready") {
        return WorkerReady{};
    }
    if (type == "exited") {
        WorkerExited exited;
        exited.code = j.value("code", 1);
        exited.reason = j.value("reason", "");
        return exited;
    }

    throw std::invalid_argument("Unknown worker message type: " + type);
}

std::string WorkerProtocol::EncodeEnvelope(const WorkerEnvelope& envelope) {
    json j = {
        {"workerId", envelope.worker_id},
        {"generation", envelope.generation},
        {"message", ToJson(envelope.message)}
    };
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

WorkerEnvelope WorkerProtocol::DecodeEnvelope(const std::string& serialized) {
    json j = ParseDocument(serialized);

    if (!j.is_object() || !j.contains("workerId") || !j.contains("message")) {
        throw std::invalid_argument("Malformed worker envelope");
    }

    WorkerEnvelope envelope;
    envelope.worker_id = j["workerId"].get<std::size_t>();
    envelope.generation = j.value("generation", std::uint64_t{0});
    envelope.message = FromJson(j["message"]);
    return envelope;
}

std::string WorkerProtocol::TypeName(const WorkerMessage& message) {
    return std::visit(Overloaded{
        [](const TaskStarted&) { return std::string("started"); },
        [](const TaskProgress&) { return std::string("progress"); },
        [](const TaskCompleted&) { return std::string("completed"); },
        [](const TaskFailed&) { return std::string("failed"); },
        [](const WorkerReady&) { return std::string("ready"); },
        [](const WorkerExited&) { return std::string("exited"); }
    }, message);
}

} // namespace core
} // namespace auditlens
