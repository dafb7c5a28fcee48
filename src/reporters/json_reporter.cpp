/**
 * @file json_reporter.cpp
 * @brief Implementation of analysis run serialization
 *
 * Field names follow the camelCase wire format consumed by the alert API and
 * the dashboards: `affectedEntities`, `mitreAttack`, `subTechniques`,
 * `uniqueIPAddresses`, `blacklistedEntities`, `dataQuality`, ...
 *
 * @date 2025
 */

#include "auditlens/reporters/json_reporter.hpp"
#include "auditlens/utils/string_utils.hpp"
#include "auditlens/utils/time_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace auditlens {
namespace reporters {

namespace {

void AddIfNotEmpty(json& j, const char* key, const std::vector<std::string>& values) {
    if (!values.empty()) {
        j[key] = values;
    }
}

} // anonymous namespace

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
    spdlog::debug("JSON Reporter output directory: {}", config_.output_directory.string());
}

// ============================================================================
// Serialization

json JsonReporter::AffectedEntitiesToJson(const analyzers::AffectedEntities& entities) {
    json j = json::object();
    AddIfNotEmpty(j, "users", entities.users);
    AddIfNotEmpty(j, "applications", entities.applications);
    AddIfNotEmpty(j, "ipAddresses", entities.ip_addresses);
    AddIfNotEmpty(j, "locations", entities.locations);
    AddIfNotEmpty(j, "userAgents", entities.user_agents);
    AddIfNotEmpty(j, "operations", entities.operations);
    AddIfNotEmpty(j, "targetResources", entities.target_resources);
    return j;
}

json JsonReporter::MitreToJson(const analyzers::MitreMapping& mapping) {
    return {
        {"tactics", mapping.tactics},
        {"techniques", mapping.techniques},
        {"subTechniques", mapping.sub_techniques}
    };
}

json JsonReporter::FindingToJson(const analyzers::Finding& finding) {
    json j;
    j["id"] = finding.id;
    j["title"] = finding.title;
    j["severity"] = analyzers::SeverityToString(finding.severity);
    j["description"] = finding.description;
    j["timestamp"] = utils::TimeUtils::FormatIso8601(finding.timestamp);
    j["source"] = finding.source;
    j["type"] = finding.type;
    j["category"] = finding.category;
    j["affectedEntities"] = AffectedEntitiesToJson(finding.affected_entities);
    j["evidence"] = finding.evidence;
    j["mitreAttack"] = MitreToJson(finding.mitre_mapping);
    j["recommendations"] = finding.recommendations;
    return j;
}

json JsonReporter::StatisticsToJson(const analyzers::RunStatistics& statistics) {
    const auto& quality = statistics.data_quality;

    json j;
    j["totalEvents"] = statistics.total_events;
    j["uniqueUsers"] = statistics.unique_users;
    j["uniqueOperations"] = statistics.unique_operations;
    j["uniqueApplications"] = statistics.unique_applications;
    j["uniqueCountries"] = statistics.unique_countries;
    j["uniqueIPAddresses"] = statistics.unique_ip_addresses;
    j["successOperations"] = statistics.successful_operations;
    j["failedOperations"] = statistics.failed_operations;
    j["suspiciousActivities"] = statistics.suspicious_activities;
    j["highSeverityEvents"] = statistics.high_severity_events;
    j["criticalSeverityEvents"] = statistics.critical_severity_events;
    j["blacklistedEntities"] = {
        {"applications", statistics.blacklisted_applications},
        {"countries", statistics.blacklisted_countries},
        {"ipAddresses", statistics.blacklisted_ip_addresses},
        {"userAgents", statistics.blacklisted_user_agents}
    };
    j["dataQuality"] = {
        {"unknownUsersBySession", quality.unknown_users_by_session},
        {"unknownUsersByIP", quality.unknown_users_by_ip},
        {"unknownUsersByApplication", quality.unknown_users_by_application},
        {"unknownUsersByTimestamp", quality.unknown_users_by_timestamp},
        {"totalUnknownUsers", quality.total_unknown_users}
    };
    return j;
}

json JsonReporter::SummaryToJson(const analyzers::RunSummary& summary) {
    json threats = json::array();
    for (const auto& threat : summary.top_threats) {
        threats.push_back({{"type", threat.type}, {"count", threat.count}});
    }

    return {
        {"totalFindings", summary.total_findings},
        {"criticalFindings", summary.critical_findings},
        {"highSeverityFindings", summary.high_severity_findings},
        {"mediumSeverityFindings", summary.medium_severity_findings},
        {"lowSeverityFindings", summary.low_severity_findings},
        {"topThreats", threats},
        {"riskScore", summary.risk_score}
    };
}

json JsonReporter::ReportToJson(const analyzers::AnalysisReport& report) {
    json findings = json::array();
    for (const auto& finding : report.findings) {
        findings.push_back(FindingToJson(finding));
    }

    json j;
    j["summary"] = SummaryToJson(report.summary);
    j["findings"] = std::move(findings);
    j["statistics"] = StatisticsToJson(report.statistics);
    return j;
}

std::string JsonReporter::GenerateJsonString(const analyzers::AnalysisReport& report) const {
    return Dump(ReportToJson(report));
}

// ============================================================================
// Output files

std::filesystem::path JsonReporter::GenerateReport(const std::string& task_id,
                                                   const json& document) const {
    try {
        if (!std::filesystem::exists(config_.output_directory)) {
            std::filesystem::create_directories(config_.output_directory);
        }

        std::filesystem::path output_path = config_.output_directory / GenerateFilename(task_id);
        if (!SaveJson(Dump(document), output_path)) {
            spdlog::error("Failed to save JSON report");
            return {};
        }

        spdlog::info("✓ Results written to {} ({} bytes)", output_path.string(),
                     std::filesystem::file_size(output_path));
        return output_path;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to generate JSON report: {}", e.what());
        return {};
    }
}

std::string JsonReporter::GenerateFilename(const std::string& task_id) const {
    std::string safe_id = task_id;
    for (char& c : safe_id) {
        if (c == '/' || c == '\\' || c == ':') {
            c = '_';
        }
    }
    return utils::StringUtils::ReplaceAll(config_.filename_pattern, "{id}", safe_id);
}

std::string JsonReporter::Dump(const json& document) const {
    const int indent = config_.pretty_print ? config_.indent_size : -1;
    return document.dump(indent, ' ', false, json::error_handler_t::replace);
}

bool JsonReporter::SaveJson(const std::string& content, const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        spdlog::error("Failed to open file for writing: {}", path.string());
        return false;
    }

    file << content;
    return static_cast<bool>(file);
}

} // namespace reporters
} // namespace auditlens
