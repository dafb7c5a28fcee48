/**
 * @file json_reporter.hpp
 * @brief JSON serialization of analysis runs and result files
 *
 * Converts findings, run statistics and summaries into the camelCase JSON
 * documents carried by task results and alerts, and writes task results to
 * `<output_directory>/<taskId>_results.json`.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "auditlens/analyzers/analysis_types.hpp"

namespace auditlens {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON output
 */
struct JsonReporterConfig {
    bool pretty_print{true};                                ///< Pretty print JSON
    int indent_size{2};                                     ///< Indentation spaces
    std::filesystem::path output_directory{"./results"};    ///< Output directory
    std::string filename_pattern{"{id}_results.json"};      ///< Filename pattern
};

/**
 * @class JsonReporter
 * @brief Machine-readable output of analysis runs
 *
 * **Document shape**:
 * @code
 * {
 *   "summary":    { "totalFindings": 3, "riskScore": 25, "topThreats": [...] },
 *   "findings":   [ { "id": "finding_1", "type": "mfa_disable", ... } ],
 *   "statistics": { "totalEvents": 120, "dataQuality": { ... }, ... }
 * }
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    static nlohmann::json FindingToJson(const analyzers::Finding& finding);
    static nlohmann::json AffectedEntitiesToJson(const analyzers::AffectedEntities& entities);
    static nlohmann::json MitreToJson(const analyzers::MitreMapping& mapping);
    static nlohmann::json StatisticsToJson(const analyzers::RunStatistics& statistics);
    static nlohmann::json SummaryToJson(const analyzers::RunSummary& summary);

    /**
     * @brief Full report document: summary, findings and statistics
     */
    static nlohmann::json ReportToJson(const analyzers::AnalysisReport& report);

    std::string GenerateJsonString(const analyzers::AnalysisReport& report) const;

    /**
     * @brief Write a task result document
     * @param task_id Substituted for `{id}` in the filename pattern
     * @param document Result payload
     * @return Path of the written file, or an empty path on failure
     */
    std::filesystem::path GenerateReport(const std::string& task_id,
                                         const nlohmann::json& document) const;

    std::string GenerateFilename(const std::string& task_id) const;

    const JsonReporterConfig& GetConfig() const { return config_; }

private:
    std::string Dump(const nlohmann::json& document) const;
    bool SaveJson(const std::string& content, const std::filesystem::path& path) const;

    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace auditlens
