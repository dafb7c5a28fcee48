/**
 * @file analysis_types.cpp
 * @brief Severity conversions
 *
 * @date 2025
 */

#include "auditlens/analyzers/analysis_types.hpp"
#include "auditlens/utils/string_utils.hpp"

namespace auditlens {
namespace analyzers {

std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "low";
}

std::optional<Severity> ParseSeverity(const std::string& name) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));

    if (lower == "low") return Severity::LOW;
    if (lower == "medium") return Severity::MEDIUM;
    if (lower == "high") return Severity::HIGH;
    if (lower == "critical") return Severity::CRITICAL;

    return std::nullopt;
}

int SeverityWeight(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL: return 10;
        case Severity::HIGH:     return 5;
        case Severity::MEDIUM:   return 2;
        case Severity::LOW:      return 1;
    }
    return 0;
}

} // namespace analyzers
} // namespace auditlens
