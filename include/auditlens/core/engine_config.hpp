/**
 * @file engine_config.hpp
 * @brief Process-wide configuration: JSON file plus environment overrides
 *
 * **File format**:
 * @code
 * {
 *   "workers": 4,
 *   "dispatch_retry_ms": 1000,
 *   "fail_orphaned_tasks": true,
 *   "blacklist_directory": "config/blacklists",
 *   "output_directories": ["/output", "/extractor_output"],
 *   "api_base_url": "http://api:3000",
 *   "service_token": "...",
 *   "alerts_file": "results/alerts.jsonl",
 *   "thresholds": { "business_hours_start": 6, "brute_force_failures": 3 }
 * }
 * @endcode
 *
 * Environment overrides: AUDITLENS_MAX_WORKERS, AUDITLENS_API_URL,
 * AUDITLENS_SERVICE_TOKEN.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "auditlens/analyzers/detection_config.hpp"
#include "auditlens/core/job_scheduler.hpp"

namespace auditlens {
namespace core {

/**
 * @struct EngineConfig
 */
struct EngineConfig {
    // Scheduler
    std::size_t workers = DefaultWorkerCount();
    std::chrono::milliseconds dispatch_retry_interval{1000};
    bool fail_orphaned_tasks{true};

    // Detection
    std::filesystem::path blacklist_directory{"config/blacklists"};
    analyzers::DetectionThresholds thresholds;

    // Data sources
    std::vector<std::filesystem::path> output_directories{
        "/output", "/extractor_output", "/app/output", "/shared/output"
    };
    std::string api_base_url;       ///< Empty: no upload store and no alert API
    std::string service_token;

    // Alerts
    std::filesystem::path alerts_file;  ///< Empty: no JSON-lines alert file

    /**
     * @brief Parse a configuration document; absent keys keep their defaults
     * @throws std::runtime_error on keys of the wrong type
     */
    static EngineConfig FromJson(const nlohmann::json& j);

    /**
     * @throws std::runtime_error if the file cannot be read or is malformed
     */
    static EngineConfig LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Apply AUDITLENS_* environment variables
     */
    void ApplyEnvironment();

    JobScheduler::Config SchedulerConfig() const;
};

} // namespace core
} // namespace auditlens
