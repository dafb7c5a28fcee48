/**
 * @file alert_emitter.cpp
 * @brief Finding to alert conversion and emission
 *
 * @date 2025
 */

#include "auditlens/reporters/alert_emitter.hpp"
#include "auditlens/reporters/json_reporter.hpp"
#include "auditlens/utils/time_utils.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace auditlens {
namespace reporters {

json Alert::ToJson() const {
    return {
        {"title", title},
        {"description", description},
        {"severity", severity},
        {"source", source},
        {"status", status},
        {"organizationId", organization_id},
        {"analysisId", analysis_id},
        {"extractionId", extraction_id},
        {"data", data}
    };
}

Alert Alert::FromFinding(const analyzers::Finding& finding, const AlertContext& context) {
    Alert alert;
    alert.title = finding.title;
    alert.description = finding.description;
    alert.severity = analyzers::SeverityToString(finding.severity);
    alert.source = finding.source;
    alert.organization_id = context.organization_id.empty()
        ? kDefaultOrganizationId : context.organization_id;
    alert.analysis_id = context.analysis_id;
    alert.extraction_id = context.extraction_id;

    json finding_json = JsonReporter::FindingToJson(finding);
    alert.data = {
        {"finding", finding_json},
        {"timestamp", finding_json["timestamp"]},
        {"details", finding.evidence},
        {"affectedEntities", finding_json["affectedEntities"]},
        {"evidence", finding.evidence},
        {"mitreAttack", finding_json["mitreAttack"]},
        {"recommendations", finding.recommendations}
    };
    return alert;
}

AlertEmitter::AlertEmitter(std::shared_ptr<AlertSink> sink)
    : sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("AlertEmitter requires an alert sink");
    }
}

bool AlertEmitter::ShouldAlert(const analyzers::Finding& finding) {
    return finding.severity == analyzers::Severity::HIGH ||
           finding.severity == analyzers::Severity::CRITICAL;
}

std::vector<json> AlertEmitter::Emit(const std::vector<analyzers::Finding>& findings,
                                     const AlertContext& context) const {
    std::vector<json> alerts;

    for (const auto& finding : findings) {
        if (!ShouldAlert(finding)) {
            continue;
        }

        Alert alert = Alert::FromFinding(finding, context);
        try {
            AlertPostResult result = sink_->PostAlert(alert);
            if (result.success) {
                spdlog::info("Created alert: {} ({})", alert.title, alert.severity);
                alerts.push_back(std::move(result.alert));
            } else {
                spdlog::warn("Alert sink rejected alert for {}", finding.id);
            }
        }
        catch (const std::exception& e) {
            spdlog::error("Failed to create alert for {}: {}", finding.id, e.what());
        }
    }

    spdlog::info("Generated {} alerts from {} findings", alerts.size(), findings.size());
    return alerts;
}

} // namespace reporters
} // namespace auditlens
