/**
 * @file alert_emitter.hpp
 * @brief Alerts derived from high and critical findings
 *
 * Every finding of severity high or critical becomes one Alert carrying the
 * finding's evidentiary payload plus the organization / run correlation
 * identifiers. Alerts are handed to an AlertSink one at a time; a delivery
 * failure is logged and the remaining alerts are still emitted.
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "auditlens/analyzers/analysis_types.hpp"

namespace auditlens {
namespace reporters {

/// Organization used when a task does not name one
inline const std::string kDefaultOrganizationId = "00000000-0000-0000-0000-000000000001";

/**
 * @struct AlertContext
 * @brief Correlation identifiers stamped on every alert of a run
 */
struct AlertContext {
    std::string organization_id{kDefaultOrganizationId};
    std::string analysis_id;
    std::string extraction_id;
};

/**
 * @struct Alert
 * @brief Externally persisted record derived 1:1 from a finding
 */
struct Alert {
    std::string title;
    std::string description;
    std::string severity;
    std::string source;
    std::string status{"new"};
    std::string organization_id;
    std::string analysis_id;
    std::string extraction_id;
    nlohmann::json data = nlohmann::json::object();   ///< finding, evidence, mitreAttack, ...

    nlohmann::json ToJson() const;

    /**
     * @brief Build the alert of a finding
     */
    static Alert FromFinding(const analyzers::Finding& finding, const AlertContext& context);
};

/**
 * @struct AlertPostResult
 * @brief Outcome reported by an AlertSink
 */
struct AlertPostResult {
    bool success{false};
    nlohmann::json alert;       ///< Alert as persisted by the sink
};

/**
 * @class AlertDeliveryError
 * @brief Transport or protocol failure while posting an alert
 */
class AlertDeliveryError : public std::runtime_error {
public:
    explicit AlertDeliveryError(const std::string& message)
        : std::runtime_error(message) {
    }
};

/**
 * @class AlertSink
 * @brief Alerting collaborator
 *
 * Implementations must be thread-safe: one sink is shared by every worker.
 */
class AlertSink {
public:
    virtual ~AlertSink() = default;

    /**
     * @throws AlertDeliveryError if the alert could not be delivered
     */
    virtual AlertPostResult PostAlert(const Alert& alert) = 0;
};

class AlertEmitter {
public:
    explicit AlertEmitter(std::shared_ptr<AlertSink> sink);

    /**
     * @brief Post an alert for each high or critical finding
     * @return Alerts accepted by the sink, in finding order
     */
    std::vector<nlohmann::json> Emit(const std::vector<analyzers::Finding>& findings,
                                     const AlertContext& context) const;

    static bool ShouldAlert(const analyzers::Finding& finding);

private:
    std::shared_ptr<AlertSink> sink_;
};

} // namespace reporters
} // namespace auditlens
