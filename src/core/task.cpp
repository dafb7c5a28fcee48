/**
 * @file task.cpp
 * @brief Task enum conversions and JSON codec
 *
 * @date 2025
 */

#include "auditlens/core/task.hpp"
#include "auditlens/utils/string_utils.hpp"

#include <stdexcept>

namespace auditlens {
namespace core {

using json = nlohmann::json;
using utils::StringUtils;
using utils::TimeUtils;

std::string TaskKindToString(TaskKind kind) {
    switch (kind) {
        case TaskKind::ANALYSIS:   return "analysis";
        case TaskKind::EXTRACTION: return "extraction";
    }
    return "analysis";
}

std::optional<TaskKind> ParseTaskKind(const std::string& name) {
    std::string lower = StringUtils::ToLower(name);
    if (lower == "analysis") return TaskKind::ANALYSIS;
    if (lower == "extraction") return TaskKind::EXTRACTION;
    return std::nullopt;
}

std::string TaskPriorityToString(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::CRITICAL: return "critical";
        case TaskPriority::HIGH:     return "high";
        case TaskPriority::MEDIUM:   return "medium";
        case TaskPriority::LOW:      return "low";
    }
    return "medium";
}

std::optional<TaskPriority> ParseTaskPriority(const std::string& name) {
    std::string lower = StringUtils::ToLower(name);
    if (lower == "critical") return TaskPriority::CRITICAL;
    if (lower == "high") return TaskPriority::HIGH;
    if (lower == "medium") return TaskPriority::MEDIUM;
    if (lower == "low") return TaskPriority::LOW;
    return std::nullopt;
}

json Task::ToJson() const {
    return {
        {"id", id},
        {"kind", TaskKindToString(kind)},
        {"payload", payload},
        {"priority", TaskPriorityToString(priority)},
        {"createdAt", TimeUtils::FormatIso8601(created_at)}
    };
}

Task Task::FromJson(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        throw std::invalid_argument("Task requires a string id");
    }

    Task task;
    task.id = j["id"].get<std::string>();

    auto kind = ParseTaskKind(j.value("kind", "analysis"));
    if (!kind) {
        throw std::invalid_argument("Unknown task kind: " + j.value("kind", ""));
    }
    task.kind = *kind;

    auto priority = ParseTaskPriority(j.value("priority", "medium"));
    if (!priority) {
        throw std::invalid_argument("Unknown task priority: " + j.value("priority", ""));
    }
    task.priority = *priority;

    if (j.contains("payload") && !j["payload"].is_null()) {
        task.payload = j["payload"];
    }

    if (j.contains("createdAt") && j["createdAt"].is_string()) {
        if (auto created = TimeUtils::ParseIso8601(j["createdAt"].get<std::string>())) {
            task.created_at = *created;
        }
    }

    return task;
}

json TaskError::ToJson() const {
    return {
        {"message", message},
        {"detail", detail}
    };
}

TaskError TaskError::FromJson(const json& j) {
    TaskError error;
    if (j.is_object()) {
        error.message = j.value("message", "");
        error.detail = j.value("detail", "");
    } else if (j.is_string()) {
        error.message = j.get<std::string>();
    }
    return error;
}

} // namespace core
} // namespace auditlens
