/**
 * @file audit_task_handler.hpp
 * @brief Task logic of the analysis and extraction jobs
 *
 * **Analysis task**:
 * 1. Load raw records (inline `events` payload, else the data source)
 * 2. Run the AuditAnalyzer pipeline
 * 3. Emit alerts for high and critical findings
 * 4. Return `{success, results{summary, findings, statistics, recommendations}, alerts}`
 *
 * Progress is reported at 10, 20, 40, 70 and 90 percent.
 *
 * **Payload**:
 * @code
 * {
 *   "extractionId": "ext-42",
 *   "organizationId": "00000000-0000-0000-0000-000000000001",
 *   "analysisId": "analysis-7",
 *   "events": [ ... ]          // optional
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "auditlens/analyzers/audit_analyzer.hpp"
#include "auditlens/core/task_handler.hpp"
#include "auditlens/parsers/audit_log_loader.hpp"
#include "auditlens/reporters/alert_emitter.hpp"

namespace auditlens {
namespace core {

class AuditTaskHandler : public TaskHandler {
public:
    struct Config {
        analyzers::AuditAnalyzer::Config analyzer;
    };

    /**
     * @param detection Shared blacklists and thresholds
     * @param data_source Record source for tasks without inline events (may be null)
     * @param alert_sink Alert destination (may be null: no alerts are emitted)
     */
    AuditTaskHandler(std::shared_ptr<const analyzers::DetectionConfig> detection,
                     std::shared_ptr<parsers::AuditDataSource> data_source,
                     std::shared_ptr<reporters::AlertSink> alert_sink,
                     const Config& config);

    AuditTaskHandler(std::shared_ptr<const analyzers::DetectionConfig> detection,
                     std::shared_ptr<parsers::AuditDataSource> data_source,
                     std::shared_ptr<reporters::AlertSink> alert_sink);

    nlohmann::json Execute(const Task& task, ProgressReporter& progress) override;

    /**
     * @brief Run-level recommendations derived from statistics and findings
     */
    static nlohmann::json BuildRunRecommendations(const analyzers::AnalysisReport& report);

private:
    nlohmann::json ExecuteAnalysis(const Task& task, ProgressReporter& progress);
    nlohmann::json ExecuteExtraction(const Task& task, ProgressReporter& progress);

    std::vector<nlohmann::json> LoadRecords(const nlohmann::json& payload,
                                            const std::string& extraction_id);

    analyzers::AuditAnalyzer analyzer_;
    std::shared_ptr<parsers::AuditDataSource> data_source_;
    std::unique_ptr<reporters::AlertEmitter> alert_emitter_;
};

} // namespace core
} // namespace auditlens
