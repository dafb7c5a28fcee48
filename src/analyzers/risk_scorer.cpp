/**
 * @file risk_scorer.cpp
 * @brief Implementation of risk scoring and top-threat ranking
 *
 * @date 2025
 */

#include "auditlens/analyzers/risk_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace auditlens {
namespace analyzers {

RiskScorer::RiskScorer(const Config& config)
    : config_(config) {
}

RiskScorer::RiskScorer()
    : RiskScorer(Config{}) {
}

int RiskScorer::CalculateRiskScore(const std::vector<Finding>& findings,
                                   const RunStatistics& statistics) const {
    double score = 0.0;

    // Base score from findings
    for (const auto& finding : findings) {
        score += SeverityWeight(finding.severity);
    }

    // Additional score from statistics
    score += static_cast<double>(statistics.failed_operations) * 0.1;
    score += static_cast<double>(statistics.blacklisted_applications.size()) * 2.0;
    score += static_cast<double>(statistics.blacklisted_countries.size()) * 3.0;
    score += static_cast<double>(statistics.blacklisted_user_agents.size()) * 1.0;

    // Round half up
    double rounded = std::floor(score + 0.5);
    return static_cast<int>(std::clamp(rounded, 0.0, static_cast<double>(config_.max_score)));
}

std::vector<ThreatCount> RiskScorer::IdentifyTopThreats(const std::vector<Finding>& findings) const {
    std::vector<ThreatCount> counts;
    std::unordered_map<std::string, std::size_t> index;

    for (const auto& finding : findings) {
        auto [it, inserted] = index.emplace(finding.type, counts.size());
        if (inserted) {
            counts.push_back(ThreatCount{finding.type, 0});
        }
        ++counts[it->second].count;
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const ThreatCount& a, const ThreatCount& b) {
                         return a.count > b.count;
                     });

    if (counts.size() > config_.top_threat_limit) {
        counts.resize(config_.top_threat_limit);
    }
    return counts;
}

RunSummary RiskScorer::Summarize(const std::vector<Finding>& findings,
                                 const RunStatistics& statistics) const {
    RunSummary summary;
    summary.total_findings = findings.size();

    for (const auto& finding : findings) {
        switch (finding.severity) {
            case Severity::CRITICAL: ++summary.critical_findings; break;
            case Severity::HIGH:     ++summary.high_severity_findings; break;
            case Severity::MEDIUM:   ++summary.medium_severity_findings; break;
            case Severity::LOW:      ++summary.low_severity_findings; break;
        }
    }

    summary.top_threats = IdentifyTopThreats(findings);
    summary.risk_score = CalculateRiskScore(findings, statistics);
    return summary;
}

} // namespace analyzers
} // namespace auditlens
