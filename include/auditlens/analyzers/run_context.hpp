/**
 * @file run_context.hpp
 * @brief Mutable state of one analysis run
 *
 * A RunContext is created per analysis run and threaded through every
 * detection rule. It owns the append-only finding list (assigning sequential
 * ids), the statistics accumulator, and the trailing window of preceding
 * events consulted by the brute-force rule.
 *
 * Statistics are two-phase: distinct values are accumulated into hash sets
 * while events stream through, then FinalizeStatistics() reduces them to
 * counts.
 *
 * @date 2025
 */

#pragma once

#include <deque>
#include <string>
#include <vector>
#include <unordered_set>

#include "auditlens/analyzers/analysis_types.hpp"
#include "auditlens/analyzers/detection_config.hpp"
#include "auditlens/analyzers/event_normalizer.hpp"
#include "auditlens/analyzers/mitre_catalog.hpp"

namespace auditlens {
namespace analyzers {

/**
 * @class DistinctValues
 * @brief Insertion-ordered set of strings
 */
class DistinctValues {
public:
    /// @return true if the value was not seen before
    bool Insert(const std::string& value);

    std::size_t Size() const { return ordered_.size(); }
    const std::vector<std::string>& Values() const { return ordered_; }

private:
    std::unordered_set<std::string> seen_;
    std::vector<std::string> ordered_;
};

/**
 * @class RunContext
 * @brief Findings, statistics and event window of one run
 */
class RunContext {
public:
    RunContext(const DetectionConfig& config,
               const MitreCatalog& catalog,
               utils::TimePoint analysis_time = utils::TimeUtils::Now());

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    const DetectionConfig& Config() const { return config_; }
    const MitreCatalog& Catalog() const { return catalog_; }
    utils::TimePoint AnalysisTime() const { return analysis_time_; }

    /***************************************************************************
     * Findings
     ***************************************************************************/

    /**
     * @brief Append a finding, assigning the next sequential id
     * @return Assigned id
     */
    std::string AddFinding(Finding finding);

    const std::vector<Finding>& Findings() const { return findings_; }
    std::vector<Finding> TakeFindings();

    /**
     * @brief Start a finding pre-filled from an event
     *
     * Sets timestamp (event time, else analysis time), type, title,
     * severity, category, MITRE mapping and recommendations from the catalog.
     */
    Finding MakeFinding(const NormalizedEvent& event,
                        const std::string& type,
                        const std::string& title,
                        Severity severity,
                        const std::string& category) const;

    /***************************************************************************
     * Statistics
     ***************************************************************************/

    /**
     * @brief Record per-event counters (distinct values, results, data quality)
     */
    void RecordEvent(const NormalizedEvent& event);

    void RecordSuspiciousActivity(Severity severity);

    void RecordBlacklistedApplication(const std::string& application);
    void RecordBlacklistedCountry(const std::string& country);
    void RecordBlacklistedIpAddress(const std::string& ip_address);
    void RecordBlacklistedUserAgent(const std::string& user_agent);

    /**
     * @brief Reduce accumulated sets to the final statistics record
     */
    RunStatistics FinalizeStatistics() const;

    /***************************************************************************
     * Trailing window
     ***************************************************************************/

    /// Preceding events, oldest first, at most the configured lookback
    const std::deque<NormalizedEvent>& RecentEvents() const { return recent_events_; }

    void PushRecentEvent(const NormalizedEvent& event);

private:
    const DetectionConfig& config_;
    const MitreCatalog& catalog_;
    const utils::TimePoint analysis_time_;

    std::vector<Finding> findings_;
    std::size_t next_finding_number_{1};

    RunStatistics counters_;
    DistinctValues users_;
    DistinctValues operations_;
    DistinctValues applications_;
    DistinctValues countries_;
    DistinctValues ip_addresses_;
    DistinctValues blacklisted_applications_;
    DistinctValues blacklisted_countries_;
    DistinctValues blacklisted_ip_addresses_;
    DistinctValues blacklisted_user_agents_;

    std::deque<NormalizedEvent> recent_events_;
};

} // namespace analyzers
} // namespace auditlens
