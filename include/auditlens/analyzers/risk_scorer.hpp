/**
 * @file risk_scorer.hpp
 * @brief Reduction of findings and statistics to a bounded risk score
 *
 * **Score formula**:
 * ```
 * score = Σ weight(finding)                 critical 10, high 5, medium 2, low 1
 *       + 0.1 × failed operations
 *       + 2   × denylisted applications
 *       + 3   × denylisted countries
 *       + 1   × denylisted user agents
 * riskScore = clamp(round(score), 0, 100)
 * ```
 *
 * Top threats are the finding-type histogram sorted by count, descending,
 * ties kept in first-seen order, truncated to five entries.
 *
 * @date 2025
 */

#pragma once

#include <vector>
#include <cstddef>

#include "auditlens/analyzers/analysis_types.hpp"

namespace auditlens {
namespace analyzers {

class RiskScorer {
public:
    struct Config {
        std::size_t top_threat_limit{5};
        int max_score{100};
    };

    explicit RiskScorer(const Config& config);
    explicit RiskScorer();

    int CalculateRiskScore(const std::vector<Finding>& findings,
                           const RunStatistics& statistics) const;

    std::vector<ThreatCount> IdentifyTopThreats(const std::vector<Finding>& findings) const;

    /**
     * @brief Severity counts, top threats and risk score
     */
    RunSummary Summarize(const std::vector<Finding>& findings,
                         const RunStatistics& statistics) const;

private:
    Config config_;
};

} // namespace analyzers
} // namespace auditlens
