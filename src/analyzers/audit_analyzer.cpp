/**
 * @file audit_analyzer.cpp
 * @brief Implementation of the audit-log analysis pipeline
 *
 * @date 2025
 */

#include "auditlens/analyzers/audit_analyzer.hpp"
#include "auditlens/analyzers/event_normalizer.hpp"
#include "auditlens/analyzers/run_context.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace auditlens {
namespace analyzers {

using json = nlohmann::json;

AuditAnalyzer::AuditAnalyzer(std::shared_ptr<const DetectionConfig> detection_config,
                             const Config& config)
    : config_(config)
    , detection_config_(std::move(detection_config))
    , rules_(CreateDefaultRules())
    , scorer_(config.scoring) {

    if (!detection_config_) {
        throw std::invalid_argument("AuditAnalyzer requires a detection configuration");
    }

    spdlog::debug("Audit analyzer ready: {} rules, {} MITRE mappings, "
                  "{} app / {} country / {} user-agent denylist entries",
                  rules_.size(), catalog_.GetMappingCount(),
                  detection_config_->ApplicationCount(),
                  detection_config_->CountryCount(),
                  detection_config_->UserAgentCount());
}

AuditAnalyzer::AuditAnalyzer(std::shared_ptr<const DetectionConfig> detection_config)
    : AuditAnalyzer(std::move(detection_config), Config{}) {
}

// ============================================================================
// Main entry point for audit analysis
// Normalizes, evaluates rules per event, correlates and scores

AnalysisReport AuditAnalyzer::Analyze(const std::vector<json>& raw_events) const {
    return Analyze(raw_events, utils::TimeUtils::Now());
}

AnalysisReport AuditAnalyzer::Analyze(const std::vector<json>& raw_events,
                                      utils::TimePoint analysis_time) const {
    spdlog::info("Starting analysis of {} audit log entries", raw_events.size());
    auto start_time = std::chrono::steady_clock::now();

    RunContext context(*detection_config_, catalog_, analysis_time);

    std::vector<NormalizedEvent> normalized;
    normalized.reserve(raw_events.size());

    // Phase 1: Per-event rule battery
    for (std::size_t i = 0; i < raw_events.size(); ++i) {
        NormalizedEvent event = EventNormalizer::Normalize(raw_events[i]);

        context.RecordEvent(event);
        for (const auto& rule : rules_) {
            rule->Evaluate(event, context);
        }
        context.PushRecentEvent(event);

        if (config_.progress_log_interval > 0 && (i + 1) % config_.progress_log_interval == 0) {
            spdlog::debug("Processed {}/{} events ({} findings so far)",
                          i + 1, raw_events.size(), context.Findings().size());
        }

        normalized.push_back(std::move(event));
    }

    // Phase 2: Cross-event correlation
    if (config_.enable_correlation) {
        std::size_t correlated = correlator_.Correlate(normalized, context);
        spdlog::debug("Correlation added {} findings", correlated);
    }

    // Phase 3: Finalize statistics and score
    AnalysisReport report;
    report.statistics = context.FinalizeStatistics();
    report.findings = context.TakeFindings();
    report.summary = scorer_.Summarize(report.findings, report.statistics);

    if (report.statistics.data_quality.total_unknown_users > 0) {
        spdlog::warn("{} of {} events had no user field; identities were synthesized",
                     report.statistics.data_quality.total_unknown_users,
                     report.statistics.total_events);
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    spdlog::info("Analysis completed: {} findings, Risk Score: {} ({} ms)",
                 report.summary.total_findings, report.summary.risk_score, duration.count());

    return report;
}

} // namespace analyzers
} // namespace auditlens
