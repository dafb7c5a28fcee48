/**
 * @file detection_rules.cpp
 * @brief Implementation of the per-event detection heuristics
 *
 * @date 2025
 */

#include "auditlens/analyzers/detection_rules.hpp"
#include "auditlens/utils/time_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace auditlens {
namespace analyzers {

using json = nlohmann::json;
using utils::TimeUtils;

namespace {

// ============================================================================
// INTERNAL HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> KnownIp(const NormalizedEvent& event) {
    if (event.ip_address == kUnknown) {
        return {};
    }
    return {event.ip_address};
}

/**
 * @brief Names of target resources, first present key per resource
 */
std::vector<std::string> TargetResourceNames(const json& resources,
                                             std::initializer_list<const char*> keys) {
    std::vector<std::string> names;
    if (!resources.is_array()) {
        return names;
    }

    for (const auto& resource : resources) {
        if (!resource.is_object()) {
            continue;
        }
        for (const char* key : keys) {
            auto it = resource.find(key);
            if (it != resource.end() && it->is_string() && !it->get<std::string>().empty()) {
                names.push_back(it->get<std::string>());
                break;
            }
        }
    }
    return names;
}

bool Matches(const std::regex& pattern, const std::string& operation) {
    return std::regex_search(operation, pattern);
}

} // anonymous namespace

OperationPattern MakeOperationPattern(const std::string& expression,
                                      const std::string& type,
                                      Severity severity,
                                      const std::string& description) {
    return OperationPattern{
        std::regex(expression, std::regex::ECMAScript | std::regex::icase),
        type,
        severity,
        description
    };
}

// ============================================================================
// BLACKLIST RULE
// ============================================================================

void BlacklistRule::Evaluate(const NormalizedEvent& event, RunContext& context) const {
    const auto& config = context.Config();
    const std::string user = event.UserName();

    if (auto hit = config.MatchApplication(event.application)) {
        context.RecordBlacklistedApplication(event.application);

        Finding finding = context.MakeFinding(event, "blacklisted_application",
                                              "Blacklisted Application Detected",
                                              Severity::HIGH, "security");
        finding.description = "Blacklisted application \"" + event.application +
                              "\" was used by " + user;
        finding.affected_entities.users = {user};
        finding.affected_entities.applications = {event.application};
        finding.affected_entities.ip_addresses = KnownIp(event);
        finding.evidence = {
            {"application", event.application},
            {"operation", event.operation},
            {"result", event.result},
            {"blacklistReason", hit->reason.empty() ? "Application is on blacklist" : hit->reason}
        };
        context.AddFinding(std::move(finding));
    }

    if (auto hit = config.MatchCountry(event.location)) {
        context.RecordBlacklistedCountry(event.location);
        if (event.ip_address != kUnknown && event.ip_address != event.location) {
            context.RecordBlacklistedIpAddress(event.ip_address);
        }

        Finding finding = context.MakeFinding(event, "blacklisted_country",
                                              "Access from Blacklisted Country",
                                              Severity::HIGH, "security");
        finding.description = "User " + user + " accessed from blacklisted country: " +
                              event.location;
        finding.affected_entities.users = {user};
        finding.affected_entities.locations = {event.location};
        finding.affected_entities.ip_addresses = KnownIp(event);
        finding.evidence = {
            {"country", event.location},
            {"ipAddress", event.ip_address},
            {"operation", event.operation},
            {"blacklistReason", hit->reason.empty() ? "Country is on blacklist" : hit->reason}
        };
        context.AddFinding(std::move(finding));
    }

    if (auto hit = config.MatchUserAgent(event.user_agent)) {
        context.RecordBlacklistedUserAgent(event.user_agent);

        Finding finding = context.MakeFinding(event, "blacklisted_user_agent",
                                              "Blacklisted User Agent Detected",
                                              Severity::MEDIUM, "security");
        finding.description = "Blacklisted user agent \"" + event.user_agent +
                              "\" used by " + user;
        finding.affected_entities.users = {user};
        finding.affected_entities.user_agents = {event.user_agent};
        finding.affected_entities.ip_addresses = KnownIp(event);
        finding.evidence = {
            {"userAgent", event.user_agent},
            {"operation", event.operation},
            {"blacklistReason", hit->reason.empty() ? "User agent is on blacklist" : hit->reason}
        };
        context.AddFinding(std::move(finding));
    }
}

// ============================================================================
// SUSPICIOUS OPERATION RULE
// ============================================================================

SuspiciousOperationRule::SuspiciousOperationRule() {
    patterns_.push_back(MakeOperationPattern(
        "password.*reset", "password_reset", Severity::MEDIUM,
        "Password reset activity detected"));
    patterns_.push_back(MakeOperationPattern(
        "role.*add|add.*role", "role_assignment", Severity::HIGH,
        "Role assignment activity detected"));
    patterns_.push_back(MakeOperationPattern(
        "permission.*grant|grant.*permission", "permission_grant", Severity::HIGH,
        "Permission grant activity detected"));
    patterns_.push_back(MakeOperationPattern(
        "delete.*user|remove.*user", "user_deletion", Severity::HIGH,
        "User deletion activity detected"));
    patterns_.push_back(MakeOperationPattern(
        "admin.*consent|consent.*admin", "admin_consent", Severity::CRITICAL,
        "Admin consent activity detected"));
    patterns_.push_back(MakeOperationPattern(
        "conditional.*access", "conditional_access", Severity::MEDIUM,
        "Conditional access policy change detected"));
    patterns_.push_back(MakeOperationPattern(
        "mfa.*disable|disable.*mfa", "mfa_disable", Severity::CRITICAL,
        "MFA disable activity detected"));
}

void SuspiciousOperationRule::Evaluate(const NormalizedEvent& event, RunContext& context) const {
    const std::string user = event.UserName();

    for (const auto& pattern : patterns_) {
        if (!Matches(pattern.pattern, event.operation)) {
            continue;
        }

        context.RecordSuspiciousActivity(pattern.severity);

        Finding finding = context.MakeFinding(event, pattern.type, pattern.description,
                                              pattern.severity, "security");
        finding.description = pattern.description + ": " + event.operation + " by " + user;
        finding.affected_entities.users = {user};
        finding.affected_entities.operations = {event.operation};
        finding.affected_entities.ip_addresses = KnownIp(event);
        finding.evidence = {
            {"operation", event.operation},
            {"result", event.result},
            {"ipAddress", event.ip_address},
            {"userAgent", event.user_agent},
            {"targetResources", event.target_resources}
        };

        spdlog::debug("Suspicious operation '{}' matched {}", event.operation, pattern.type);
        context.AddFinding(std::move(finding));
    }
}

// ============================================================================
// TIME ANOMALY RULE
// ============================================================================

void TimeAnomalyRule::Evaluate(const NormalizedEvent& event, RunContext& context) const {
    if (!event.timestamp) {
        return;
    }

    const auto& thresholds = context.Config().Thresholds();
    const std::string user = event.UserName();
    const int hour = TimeUtils::LocalHour(*event.timestamp);
    const int day_of_week = TimeUtils::LocalWeekday(*event.timestamp);

    if (hour < thresholds.business_hours_start || hour > thresholds.business_hours_end) {
        Finding finding = context.MakeFinding(event, "after_hours_activity",
                                              "After-hours Activity",
                                              Severity::MEDIUM, "behavioral");
        finding.description = "User " + user + " performed " + event.operation +
                              " outside business hours (" + std::to_string(hour) + ":00)";
        finding.affected_entities.users = {user};
        finding.affected_entities.operations = {event.operation};
        finding.evidence = {
            {"hour", hour},
            {"dayOfWeek", day_of_week},
            {"operation", event.operation}
        };
        context.AddFinding(std::move(finding));
    }

    if (day_of_week == 0 || day_of_week == 6) {
        Finding finding = context.MakeFinding(event, "weekend_activity",
                                              "Weekend Activity",
                                              Severity::LOW, "behavioral");
        finding.description = "User " + user + " performed " + event.operation +
                              " during weekend";
        finding.affected_entities.users = {user};
        finding.affected_entities.operations = {event.operation};
        finding.evidence = {
            {"dayOfWeek", day_of_week},
            {"operation", event.operation}
        };
        context.AddFinding(std::move(finding));
    }
}

// ============================================================================
// PERMISSION CHANGE RULE
// ============================================================================

PermissionChangeRule::PermissionChangeRule() {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    for (const char* expression : {
             "permission.*add|add.*permission",
             "permission.*remove|remove.*permission",
             "permission.*modify|modify.*permission",
             "role.*assign|assign.*role",
             "role.*remove|remove.*role",
             "privilege.*escalat",
             "admin.*add|add.*admin"}) {
        patterns_.emplace_back(expression, flags);
    }
}

void PermissionChangeRule::Evaluate(const NormalizedEvent& event, RunContext& context) const {
    const std::string user = event.UserName();

    for (const auto& pattern : patterns_) {
        if (!Matches(pattern, event.operation)) {
            continue;
        }

        Finding finding = context.MakeFinding(event, "permission_change",
                                              "Permission Change Detected",
                                              Severity::HIGH, "security");
        finding.description = "Permission change detected: " + event.operation + " by " + user;
        finding.affected_entities.users = {user};
        finding.affected_entities.operations = {event.operation};
        finding.affected_entities.target_resources =
            TargetResourceNames(event.target_resources, {"displayName", "id"});
        finding.evidence = {
            {"operation", event.operation},
            {"result", event.result},
            {"targetResources", event.target_resources}
        };
        context.AddFinding(std::move(finding));
    }
}

// ============================================================================
// ACCOUNT LIFECYCLE RULE
// ============================================================================

AccountLifecycleRule::AccountLifecycleRule() {
    patterns_.push_back(MakeOperationPattern(
        R"(\bcreate[ds]?\s+user|\buser\s+create[ds]?\b)", "user_creation", Severity::MEDIUM,
        "User account creation detected"));
    patterns_.push_back(MakeOperationPattern(
        R"(\bdelete[ds]?\s+user|\buser\s+delete[ds]?\b)", "user_deletion", Severity::HIGH,
        "User account deletion detected"));
    patterns_.push_back(MakeOperationPattern(
        R"(\bdisable[ds]?\s+user|\buser\s+disable[ds]?\b)", "user_disable", Severity::MEDIUM,
        "User account disable detected"));
    patterns_.push_back(MakeOperationPattern(
        R"(\benable[ds]?\s+user|\buser\s+enable[ds]?\b)", "user_enable", Severity::MEDIUM,
        "User account enable detected"));
    patterns_.push_back(MakeOperationPattern(
        "password.*change|change.*password", "password_change", Severity::LOW,
        "Password change detected"));
}

void AccountLifecycleRule::Evaluate(const NormalizedEvent& event, RunContext& context) const {
    const std::string user = event.UserName();

    for (const auto& pattern : patterns_) {
        if (!Matches(pattern.pattern, event.operation)) {
            continue;
        }

        Finding finding = context.MakeFinding(event, pattern.type, pattern.description,
                                              pattern.severity, "account_management");
        finding.description = pattern.description + ": " + event.operation + " by " + user;
        finding.affected_entities.users = {user};
        finding.affected_entities.operations = {event.operation};
        finding.affected_entities.target_resources =
            TargetResourceNames(event.target_resources, {"userPrincipalName", "displayName", "id"});
        finding.evidence = {
            {"operation", event.operation},
            {"result", event.result},
            {"targetResources", event.target_resources}
        };
        context.AddFinding(std::move(finding));
    }
}

// ============================================================================
// APPLICATION LIFECYCLE RULE
// ============================================================================

ApplicationLifecycleRule::ApplicationLifecycleRule() {
    patterns_.push_back(MakeOperationPattern(
        "application.*create|create.*application", "app_creation", Severity::MEDIUM,
        "Application creation detected"));
    patterns_.push_back(MakeOperationPattern(
        "application.*delete|delete.*application", "app_deletion", Severity::HIGH,
        "Application deletion detected"));
    patterns_.push_back(MakeOperationPattern(
        "service.*principal", "service_principal", Severity::MEDIUM,
        "Service principal activity detected"));
    patterns_.push_back(MakeOperationPattern(
        "oauth.*consent|consent.*oauth", "oauth_consent", Severity::HIGH,
        "OAuth consent activity detected"));
}

void ApplicationLifecycleRule::Evaluate(const NormalizedEvent& event, RunContext& context) const {
    const std::string user = event.UserName();

    for (const auto& pattern : patterns_) {
        if (!Matches(pattern.pattern, event.operation)) {
            continue;
        }

        Finding finding = context.MakeFinding(event, pattern.type, pattern.description,
                                              pattern.severity, "application_management");
        finding.description = pattern.description + ": " + event.operation + " by " + user;
        finding.affected_entities.users = {user};
        finding.affected_entities.applications = {event.application};
        finding.affected_entities.operations = {event.operation};
        finding.evidence = {
            {"operation", event.operation},
            {"result", event.result},
            {"application", event.application},
            {"targetResources", event.target_resources}
        };
        context.AddFinding(std::move(finding));
    }
}

// ============================================================================
// BRUTE FORCE RULE
// ============================================================================

void BruteForceRule::Evaluate(const NormalizedEvent& event, RunContext& context) const {
    if (!EventNormalizer::IsFailure(event.result) || !event.timestamp) {
        return;
    }

    const auto& thresholds = context.Config().Thresholds();
    const auto window_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        thresholds.brute_force_window).count();
    const auto event_ms = TimeUtils::ToEpochMillis(*event.timestamp);

    std::size_t failure_count = 1;  // the current failure
    for (const auto& previous : context.RecentEvents()) {
        if (previous.user != event.user ||
            !EventNormalizer::IsFailure(previous.result) ||
            !previous.timestamp) {
            continue;
        }
        auto delta = std::llabs(TimeUtils::ToEpochMillis(*previous.timestamp) - event_ms);
        if (delta < window_ms) {
            ++failure_count;
        }
    }

    if (failure_count <= thresholds.brute_force_failures) {
        return;
    }

    const std::string user = event.UserName();

    Finding finding = context.MakeFinding(event, "brute_force",
                                          "Potential Brute Force Attack",
                                          Severity::HIGH, "security");
    finding.description = "User " + user + " has " + std::to_string(failure_count) +
                          " failed attempts in the last hour";
    finding.affected_entities.users = {user};
    finding.affected_entities.ip_addresses = KnownIp(event);
    finding.evidence = {
        {"failureCount", failure_count},
        {"timeWindow", "1 hour"},
        {"ipAddress", event.ip_address},
        {"userAgent", event.user_agent}
    };

    spdlog::debug("Brute force threshold exceeded for {} ({} failures)", user, failure_count);
    context.AddFinding(std::move(finding));
}

// ============================================================================
// RULE FACTORY
// ============================================================================

std::vector<std::unique_ptr<DetectionRule>> CreateDefaultRules() {
    std::vector<std::unique_ptr<DetectionRule>> rules;
    rules.push_back(std::make_unique<BlacklistRule>());
    rules.push_back(std::make_unique<SuspiciousOperationRule>());
    rules.push_back(std::make_unique<TimeAnomalyRule>());
    rules.push_back(std::make_unique<PermissionChangeRule>());
    rules.push_back(std::make_unique<AccountLifecycleRule>());
    rules.push_back(std::make_unique<ApplicationLifecycleRule>());
    rules.push_back(std::make_unique<BruteForceRule>());
    return rules;
}

} // namespace analyzers
} // namespace auditlens
