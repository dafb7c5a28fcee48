/**
 * @file audit_analyzer.hpp
 * @brief Multi-pass security analysis of a batch of audit records
 *
 * The AuditAnalyzer runs the complete detection pipeline over one batch:
 * normalization, the per-event rule battery, cross-event correlation and
 * risk scoring. It is the computational core executed by analysis tasks.
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include "auditlens/analyzers/analysis_types.hpp"
#include "auditlens/analyzers/detection_config.hpp"
#include "auditlens/analyzers/detection_rules.hpp"
#include "auditlens/analyzers/event_correlator.hpp"
#include "auditlens/analyzers/mitre_catalog.hpp"
#include "auditlens/analyzers/risk_scorer.hpp"

namespace auditlens {
namespace analyzers {

/**
 * @class AuditAnalyzer
 * @brief Detection pipeline over normalized audit events
 *
 * **Pipeline**:
 * 1. Normalize each raw record (EventNormalizer)
 * 2. Update run statistics and evaluate every DetectionRule, in order
 * 3. Correlate the whole batch (EventCorrelator)
 * 4. Finalize statistics, rank threats and score risk (RiskScorer)
 *
 * An analyzer instance is immutable after construction and can be shared by
 * several threads; each Analyze() call owns its own RunContext.
 *
 * **Usage Example**:
 * @code
 * auto detection = DetectionConfig::LoadFromDirectory("config/blacklists");
 * AuditAnalyzer analyzer(detection);
 *
 * std::vector<nlohmann::json> events = LoadEvents();
 * AnalysisReport report = analyzer.Analyze(events);
 * spdlog::info("Risk score: {}", report.summary.risk_score);
 * @endcode
 */
class AuditAnalyzer {
public:
    /**
     * @struct Config
     * @brief Pipeline switches
     */
    struct Config {
        bool enable_correlation{true};          ///< Run the cross-event pass
        std::size_t progress_log_interval{10000}; ///< Debug log every N events (0 = off)
        RiskScorer::Config scoring;             ///< Score and ranking limits
    };

    AuditAnalyzer(std::shared_ptr<const DetectionConfig> detection_config, const Config& config);
    explicit AuditAnalyzer(std::shared_ptr<const DetectionConfig> detection_config);

    AuditAnalyzer(const AuditAnalyzer&) = delete;
    AuditAnalyzer& operator=(const AuditAnalyzer&) = delete;

    /**
     * @brief Analyze a batch of raw audit records
     * @param raw_events Records in input order
     * @return Findings, statistics and summary
     */
    AnalysisReport Analyze(const std::vector<nlohmann::json>& raw_events) const;

    /**
     * @brief Analyze with an explicit analysis time
     *
     * The analysis time stamps correlator findings and findings of events
     * without a timestamp.
     */
    AnalysisReport Analyze(const std::vector<nlohmann::json>& raw_events,
                           utils::TimePoint analysis_time) const;

    const DetectionConfig& GetDetectionConfig() const { return *detection_config_; }

private:
    Config config_;
    std::shared_ptr<const DetectionConfig> detection_config_;
    MitreCatalog catalog_;
    std::vector<std::unique_ptr<DetectionRule>> rules_;
    EventCorrelator correlator_;
    RiskScorer scorer_;
};

} // namespace analyzers
} // namespace auditlens
