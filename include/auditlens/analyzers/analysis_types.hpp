/**
 * @file analysis_types.hpp
 * @brief Shared result types of the audit-log analysis pipeline
 *
 * Defines findings, MITRE ATT&CK mappings, run statistics and the run summary
 * produced by the detection rules, the cross-event correlator and the risk
 * scorer. These types are plain values; the JSON shapes persisted by the job
 * store and posted to the alerting API are produced by the JSON reporter.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

#include <nlohmann/json.hpp>

#include "auditlens/utils/time_utils.hpp"

namespace auditlens {
namespace analyzers {

/**
 * @enum Severity
 * @brief Finding severity, ordered from least to most severe
 */
enum class Severity {
    LOW,        ///< Informational anomaly
    MEDIUM,     ///< Suspicious, review recommended
    HIGH,       ///< Likely malicious or high-impact change
    CRITICAL    ///< Immediate response required
};

/**
 * @brief Lowercase wire name ("low", "medium", "high", "critical")
 */
std::string SeverityToString(Severity severity);

/**
 * @brief Parse a severity name (case-insensitive)
 * @return Severity, or std::nullopt for unknown names
 */
std::optional<Severity> ParseSeverity(const std::string& name);

/**
 * @brief Risk-score weight of one finding: critical 10, high 5, medium 2, low 1
 */
int SeverityWeight(Severity severity);

/**
 * @struct MitreMapping
 * @brief MITRE ATT&CK classification attached to a finding
 *
 * @see https://attack.mitre.org/tactics/enterprise/
 */
struct MitreMapping {
    std::vector<std::string> tactics;          ///< e.g. "Privilege Escalation"
    std::vector<std::string> techniques;       ///< e.g. "T1134"
    std::vector<std::string> sub_techniques;   ///< e.g. "T1134.001"
};

/**
 * @struct AffectedEntities
 * @brief Entities implicated by a finding
 *
 * Only non-empty lists are serialized.
 */
struct AffectedEntities {
    std::vector<std::string> users;
    std::vector<std::string> applications;
    std::vector<std::string> ip_addresses;
    std::vector<std::string> locations;
    std::vector<std::string> user_agents;
    std::vector<std::string> operations;
    std::vector<std::string> target_resources;
};

/**
 * @struct Finding
 * @brief One detected security-relevant condition
 *
 * Findings are append-only within a run and never mutated after creation.
 * Ids are sequential within a run (`finding_1`, `finding_2`, ...).
 */
struct Finding {
    std::string id;                             ///< Sequential id within the run
    std::string title;                          ///< Short human-readable title
    Severity severity{Severity::LOW};           ///< Finding severity
    std::string description;                    ///< Detail sentence naming user and operation
    utils::TimePoint timestamp;                 ///< Event time (analysis time for correlator findings)
    std::string source{"entra_audit_logs"};     ///< Log source tag
    std::string type;                           ///< Detection type (e.g. "mfa_disable")
    std::string category;                       ///< security | behavioral | account_management | application_management
    AffectedEntities affected_entities;         ///< Implicated users, apps, IPs, ...
    nlohmann::json evidence = nlohmann::json::object();  ///< Structured proof
    MitreMapping mitre_mapping;                 ///< ATT&CK classification
    std::vector<std::string> recommendations;   ///< Ordered remediation steps
};

/**
 * @struct DataQuality
 * @brief Synthesized-identity counters, by synthesis strategy
 */
struct DataQuality {
    std::size_t unknown_users_by_session{0};
    std::size_t unknown_users_by_ip{0};
    std::size_t unknown_users_by_application{0};
    std::size_t unknown_users_by_timestamp{0};
    std::size_t total_unknown_users{0};         ///< Events whose user was synthesized
};

/**
 * @struct RunStatistics
 * @brief Aggregate counters of one analysis run
 *
 * Distinct counts are finalized from per-run hash sets once all events are
 * processed. Blacklist hit lists hold distinct values in first-hit order.
 */
struct RunStatistics {
    std::size_t total_events{0};
    std::size_t unique_users{0};
    std::size_t unique_operations{0};
    std::size_t unique_applications{0};
    std::size_t unique_countries{0};
    std::size_t unique_ip_addresses{0};

    std::size_t successful_operations{0};
    std::size_t failed_operations{0};
    std::size_t suspicious_activities{0};
    std::size_t high_severity_events{0};
    std::size_t critical_severity_events{0};

    std::vector<std::string> blacklisted_applications;
    std::vector<std::string> blacklisted_countries;
    std::vector<std::string> blacklisted_ip_addresses;
    std::vector<std::string> blacklisted_user_agents;

    DataQuality data_quality;
};

/**
 * @struct ThreatCount
 * @brief One entry of the top-threat ranking
 */
struct ThreatCount {
    std::string type;
    std::size_t count{0};
};

/**
 * @struct RunSummary
 * @brief Reduced view of a run used for prioritization
 */
struct RunSummary {
    std::size_t total_findings{0};
    std::size_t critical_findings{0};
    std::size_t high_severity_findings{0};
    std::size_t medium_severity_findings{0};
    std::size_t low_severity_findings{0};
    std::vector<ThreatCount> top_threats;   ///< At most 5, count descending
    int risk_score{0};                      ///< 0-100
};

/**
 * @struct AnalysisReport
 * @brief Complete output of one analysis run
 */
struct AnalysisReport {
    std::vector<Finding> findings;
    RunStatistics statistics;
    RunSummary summary;
};

} // namespace analyzers
} // namespace auditlens
