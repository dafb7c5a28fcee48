/**
 * @file detection_rules.hpp
 * @brief Per-event security heuristics
 *
 * Each rule inspects one normalized event and appends zero or more findings
 * (and statistics) to the RunContext. Rules are independent of each other
 * and are evaluated in a fixed order for every event:
 *
 * | Rule                       | Types emitted                                         |
 * |----------------------------|-------------------------------------------------------|
 * | BlacklistRule              | blacklisted_application / _country / _user_agent      |
 * | SuspiciousOperationRule    | password_reset ... mfa_disable                        |
 * | TimeAnomalyRule            | after_hours_activity, weekend_activity                |
 * | PermissionChangeRule       | permission_change (one per matching pattern)          |
 * | AccountLifecycleRule       | user_creation / _deletion / _disable / _enable, password_change |
 * | ApplicationLifecycleRule   | app_creation / app_deletion, service_principal, oauth_consent |
 * | BruteForceRule             | brute_force                                           |
 *
 * Operation patterns are case-insensitive ECMAScript regular expressions
 * compiled once per rule instance.
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "auditlens/analyzers/run_context.hpp"

namespace auditlens {
namespace analyzers {

/**
 * @class DetectionRule
 * @brief Interface of a per-event detection heuristic
 */
class DetectionRule {
public:
    virtual ~DetectionRule() = default;

    /// Short rule name for logging
    virtual std::string Name() const = 0;

    /**
     * @brief Evaluate one event
     * @param event Normalized event
     * @param context Run state; findings and statistics are appended here
     */
    virtual void Evaluate(const NormalizedEvent& event, RunContext& context) const = 0;
};

/**
 * @struct OperationPattern
 * @brief Compiled operation-name pattern and the finding it produces
 */
struct OperationPattern {
    std::regex pattern;
    std::string type;
    Severity severity;
    std::string description;
};

/**
 * @brief Compile a case-insensitive operation pattern
 */
OperationPattern MakeOperationPattern(const std::string& expression,
                                      const std::string& type,
                                      Severity severity,
                                      const std::string& description);

// ============================================================================
// Denylist match
// ============================================================================

class BlacklistRule : public DetectionRule {
public:
    std::string Name() const override { return "blacklist"; }
    void Evaluate(const NormalizedEvent& event, RunContext& context) const override;
};

// ============================================================================
// Suspicious operation names
// ============================================================================

/**
 * @class SuspiciousOperationRule
 * @brief Flags sensitive directory operations
 *
 * Patterns, in evaluation order: password reset (medium), role assignment
 * (high), permission grant (high), user deletion (high), admin consent
 * (critical), conditional access (medium), MFA disable (critical). Every match
 * also counts as a suspicious activity in the run statistics.
 */
class SuspiciousOperationRule : public DetectionRule {
public:
    SuspiciousOperationRule();

    std::string Name() const override { return "suspicious_operation"; }
    void Evaluate(const NormalizedEvent& event, RunContext& context) const override;

private:
    std::vector<OperationPattern> patterns_;
};

// ============================================================================
// Time anomalies
// ============================================================================

/**
 * @class TimeAnomalyRule
 * @brief After-hours (medium) and weekend (low) activity
 *
 * Hour and weekday are taken in the local time zone of the analysis host.
 * Events without a timestamp are skipped.
 */
class TimeAnomalyRule : public DetectionRule {
public:
    std::string Name() const override { return "time_anomaly"; }
    void Evaluate(const NormalizedEvent& event, RunContext& context) const override;
};

// ============================================================================
// Permission changes
// ============================================================================

class PermissionChangeRule : public DetectionRule {
public:
    PermissionChangeRule();

    std::string Name() const override { return "permission_change"; }
    void Evaluate(const NormalizedEvent& event, RunContext& context) const override;

private:
    std::vector<std::regex> patterns_;
};

// ============================================================================
// Account lifecycle
// ============================================================================

/**
 * @class AccountLifecycleRule
 * @brief User create / delete / disable / enable and password change
 *
 * The lifecycle verb must be adjacent to "user" (`Disable user`,
 * `User disabled`), so `Disable MFA for user` is not an account disable.
 */
class AccountLifecycleRule : public DetectionRule {
public:
    AccountLifecycleRule();

    std::string Name() const override { return "account_lifecycle"; }
    void Evaluate(const NormalizedEvent& event, RunContext& context) const override;

private:
    std::vector<OperationPattern> patterns_;
};

// ============================================================================
// Application lifecycle
// ============================================================================

class ApplicationLifecycleRule : public DetectionRule {
public:
    ApplicationLifecycleRule();

    std::string Name() const override { return "application_lifecycle"; }
    void Evaluate(const NormalizedEvent& event, RunContext& context) const override;

private:
    std::vector<OperationPattern> patterns_;
};

// ============================================================================
// Brute force
// ============================================================================

/**
 * @class BruteForceRule
 * @brief Repeated failures for one user inside the failure window
 *
 * For a failed event, counts the failed events of the same user among the
 * preceding window (RunContext::RecentEvents) whose timestamps lie within
 * the window of the current one, plus the current failure. A finding is
 * emitted when the count exceeds the threshold (default: more than 3 within
 * one hour).
 */
class BruteForceRule : public DetectionRule {
public:
    std::string Name() const override { return "brute_force"; }
    void Evaluate(const NormalizedEvent& event, RunContext& context) const override;
};

/**
 * @brief The standard rule battery, in evaluation order
 */
std::vector<std::unique_ptr<DetectionRule>> CreateDefaultRules();

} // namespace analyzers
} // namespace auditlens
