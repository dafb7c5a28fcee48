/**
 * @file audit_task_handler.cpp
 * @brief Analysis and extraction job execution
 *
 * @date 2025
 */

#include "auditlens/core/audit_task_handler.hpp"
#include "auditlens/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

using json = nlohmann::json;

namespace auditlens {
namespace core {

namespace {

std::string PayloadString(const json& payload, const char* key, const std::string& fallback) {
    auto it = payload.find(key);
    if (it != payload.end() && it->is_string() && !it->get<std::string>().empty()) {
        return it->get<std::string>();
    }
    return fallback;
}

} // anonymous namespace

AuditTaskHandler::AuditTaskHandler(std::shared_ptr<const analyzers::DetectionConfig> detection,
                                   std::shared_ptr<parsers::AuditDataSource> data_source,
                                   std::shared_ptr<reporters::AlertSink> alert_sink,
                                   const Config& config)
    : analyzer_(std::move(detection), config.analyzer)
    , data_source_(std::move(data_source)) {

    if (alert_sink) {
        alert_emitter_ = std::make_unique<reporters::AlertEmitter>(std::move(alert_sink));
    }
}

AuditTaskHandler::AuditTaskHandler(std::shared_ptr<const analyzers::DetectionConfig> detection,
                                   std::shared_ptr<parsers::AuditDataSource> data_source,
                                   std::shared_ptr<reporters::AlertSink> alert_sink)
    : AuditTaskHandler(std::move(detection), std::move(data_source),
                       std::move(alert_sink), Config{}) {
}

json AuditTaskHandler::Execute(const Task& task, ProgressReporter& progress) {
    switch (task.kind) {
        case TaskKind::ANALYSIS:
            return ExecuteAnalysis(task, progress);
        case TaskKind::EXTRACTION:
            return ExecuteExtraction(task, progress);
    }
    throw std::invalid_argument("Unknown job type for task " + task.id);
}

// ============================================================================
// Analysis

json AuditTaskHandler::ExecuteAnalysis(const Task& task, ProgressReporter& progress) {
    const json& payload = task.payload;

    reporters::AlertContext context;
    context.analysis_id = PayloadString(payload, "analysisId", task.id);
    context.extraction_id = PayloadString(payload, "extractionId", "");
    context.organization_id = PayloadString(payload, "organizationId",
                                            reporters::kDefaultOrganizationId);

    spdlog::info("[1/5] Starting analysis {} (extraction {})", context.analysis_id,
                 context.extraction_id.empty() ? "inline" : context.extraction_id);
    progress.Report(10, "Starting analysis");

    spdlog::info("[2/5] Loading extraction data");
    progress.Report(20, "Loading extraction data");
    std::vector<json> records = LoadRecords(payload, context.extraction_id);
    spdlog::info("Loaded {} audit log entries for analysis", records.size());

    spdlog::info("[3/5] Analyzing audit logs");
    progress.Report(40, "Analyzing audit logs");
    analyzers::AnalysisReport report = analyzer_.Analyze(records);

    spdlog::info("[4/5] Generating alerts");
    progress.Report(70, "Generating alerts");
    std::vector<json> alerts;
    if (alert_emitter_) {
        alerts = alert_emitter_->Emit(report.findings, context);
    }

    spdlog::info("[5/5] Finalizing analysis");
    progress.Report(90, "Finalizing analysis");

    json results = reporters::JsonReporter::ReportToJson(report);
    results["recommendations"] = BuildRunRecommendations(report);

    json result;
    result["success"] = true;
    result["results"] = std::move(results);
    result["alerts"] = alerts;

    spdlog::info("Completed analysis {} with {} findings and {} alerts",
                 context.analysis_id, report.findings.size(), alerts.size());
    return result;
}

std::vector<json> AuditTaskHandler::LoadRecords(const json& payload,
                                                const std::string& extraction_id) {
    auto inline_events = payload.find("events");
    if (inline_events != payload.end()) {
        if (!inline_events->is_array()) {
            throw std::invalid_argument("Payload field 'events' must be an array");
        }
        return std::vector<json>(inline_events->begin(), inline_events->end());
    }

    if (extraction_id.empty()) {
        throw std::invalid_argument("Analysis payload needs 'extractionId' or 'events'");
    }
    if (!data_source_) {
        throw parsers::NoDataFoundError("No data source configured for extraction " +
                                        extraction_id);
    }
    return data_source_->Fetch(extraction_id);
}

json AuditTaskHandler::BuildRunRecommendations(const analyzers::AnalysisReport& report) {
    const auto& stats = report.statistics;
    json recommendations = json::array();

    if (stats.failed_operations > 0) {
        recommendations.push_back({
            {"type", "security"},
            {"priority", "high"},
            {"title", "Review failed authentication attempts"},
            {"description", "Found " + std::to_string(stats.failed_operations) +
                            " failed operations. Review for potential brute force attacks."},
            {"action", "Investigate failed login patterns and consider implementing account "
                       "lockout policies."}
        });
    }

    if (stats.high_severity_events > 0) {
        recommendations.push_back({
            {"type", "security"},
            {"priority", "critical"},
            {"title", "Address high severity security events"},
            {"description", "Found " + std::to_string(stats.high_severity_events) +
                            " high severity events requiring immediate attention."},
            {"action", "Review and respond to all high severity findings immediately."}
        });
    }

    const bool after_hours = std::any_of(report.findings.begin(), report.findings.end(),
        [](const analyzers::Finding& finding) {
            return finding.type == "after_hours_activity";
        });
    if (after_hours) {
        recommendations.push_back({
            {"type", "monitoring"},
            {"priority", "medium"},
            {"title", "Monitor after-hours activity"},
            {"description", "Detected activity outside normal business hours."},
            {"action", "Implement monitoring for unusual time patterns and consider geo-fencing."}
        });
    }

    return recommendations;
}

// ============================================================================
// Extraction

json AuditTaskHandler::ExecuteExtraction(const Task& task, ProgressReporter& progress) {
    const std::string extraction_id = PayloadString(task.payload, "extractionId", task.id);
    spdlog::info("Processing extraction {}", extraction_id);

    progress.Report(10, "Starting extraction");
    progress.Report(50, "Extracting data");
    progress.Report(90, "Finalizing extraction");

    return {
        {"success", true},
        {"message", "Extraction completed successfully"}
    };
}

} // namespace core
} // namespace auditlens
