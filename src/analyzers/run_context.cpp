/**
 * @file run_context.cpp
 * @brief Implementation of per-run analysis state
 *
 * @date 2025
 */

#include "auditlens/analyzers/run_context.hpp"

namespace auditlens {
namespace analyzers {

bool DistinctValues::Insert(const std::string& value) {
    if (!seen_.insert(value).second) {
        return false;
    }
    ordered_.push_back(value);
    return true;
}

RunContext::RunContext(const DetectionConfig& config,
                       const MitreCatalog& catalog,
                       utils::TimePoint analysis_time)
    : config_(config)
    , catalog_(catalog)
    , analysis_time_(analysis_time) {
}

// ============================================================================
// FINDINGS
// ============================================================================

std::string RunContext::AddFinding(Finding finding) {
    finding.id = "finding_" + std::to_string(next_finding_number_++);
    findings_.push_back(std::move(finding));
    return findings_.back().id;
}

std::vector<Finding> RunContext::TakeFindings() {
    std::vector<Finding> taken = std::move(findings_);
    findings_.clear();
    return taken;
}

Finding RunContext::MakeFinding(const NormalizedEvent& event,
                                const std::string& type,
                                const std::string& title,
                                Severity severity,
                                const std::string& category) const {
    Finding finding;
    finding.title = title;
    finding.severity = severity;
    finding.timestamp = event.timestamp.value_or(analysis_time_);
    finding.type = type;
    finding.category = category;
    finding.mitre_mapping = catalog_.MappingFor(type);
    finding.recommendations = catalog_.RecommendationsFor(type);
    return finding;
}

// ============================================================================
// STATISTICS
// ============================================================================

void RunContext::RecordEvent(const NormalizedEvent& event) {
    ++counters_.total_events;

    users_.Insert(event.UserName());
    operations_.Insert(event.operation);
    applications_.Insert(event.application);
    countries_.Insert(event.location);
    ip_addresses_.Insert(event.ip_address);

    if (EventNormalizer::IsSuccess(event.result)) {
        ++counters_.successful_operations;
    } else if (EventNormalizer::IsFailure(event.result)) {
        ++counters_.failed_operations;
    }

    auto& quality = counters_.data_quality;
    switch (event.user.strategy) {
        case IdentityStrategy::REAL:
            return;
        case IdentityStrategy::SESSION:
            ++quality.unknown_users_by_session;
            break;
        case IdentityStrategy::IP:
            ++quality.unknown_users_by_ip;
            break;
        case IdentityStrategy::APPLICATION:
            ++quality.unknown_users_by_application;
            break;
        case IdentityStrategy::TIMESTAMP:
            ++quality.unknown_users_by_timestamp;
            break;
    }
    ++quality.total_unknown_users;
}

void RunContext::RecordSuspiciousActivity(Severity severity) {
    ++counters_.suspicious_activities;

    if (severity == Severity::HIGH) {
        ++counters_.high_severity_events;
    } else if (severity == Severity::CRITICAL) {
        ++counters_.critical_severity_events;
    }
}

void RunContext::RecordBlacklistedApplication(const std::string& application) {
    blacklisted_applications_.Insert(application);
}

void RunContext::RecordBlacklistedCountry(const std::string& country) {
    blacklisted_countries_.Insert(country);
}

void RunContext::RecordBlacklistedIpAddress(const std::string& ip_address) {
    blacklisted_ip_addresses_.Insert(ip_address);
}

void RunContext::RecordBlacklistedUserAgent(const std::string& user_agent) {
    blacklisted_user_agents_.Insert(user_agent);
}

RunStatistics RunContext::FinalizeStatistics() const {
    RunStatistics stats = counters_;

    stats.unique_users = users_.Size();
    stats.unique_operations = operations_.Size();
    stats.unique_applications = applications_.Size();
    stats.unique_countries = countries_.Size();
    stats.unique_ip_addresses = ip_addresses_.Size();

    stats.blacklisted_applications = blacklisted_applications_.Values();
    stats.blacklisted_countries = blacklisted_countries_.Values();
    stats.blacklisted_ip_addresses = blacklisted_ip_addresses_.Values();
    stats.blacklisted_user_agents = blacklisted_user_agents_.Values();

    return stats;
}

// ============================================================================
// TRAILING WINDOW
// ============================================================================

void RunContext::PushRecentEvent(const NormalizedEvent& event) {
    std::size_t lookback = config_.Thresholds().brute_force_lookback;
    if (lookback == 0) {
        return;
    }

    recent_events_.push_back(event);
    while (recent_events_.size() > lookback) {
        recent_events_.pop_front();
    }
}

} // namespace analyzers
} // namespace auditlens
