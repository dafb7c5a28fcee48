/**
 * @file detection_config.hpp
 * @brief Immutable denylists and thresholds shared by every analysis worker
 *
 * Denylists are loaded once at startup from CSV files in a blacklist
 * directory and published as `std::shared_ptr<const DetectionConfig>`.
 * Workers only ever read it, so no synchronization is needed.
 *
 * **Denylist files** (each with an optional `Reason` column):
 * - `Application-Blacklist.csv`, column `AppDisplayName`
 * - `Country-Blacklist.csv`, column `Country`
 * - `UserAgent-Blacklist.csv`, column `UserAgent`
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <cstddef>
#include <filesystem>

namespace auditlens {
namespace analyzers {

/**
 * @struct BlacklistEntry
 * @brief One denylist row
 */
struct BlacklistEntry {
    std::string value;      ///< Matched case-insensitively as a substring
    std::string reason;     ///< Optional justification (empty if absent)
};

/**
 * @struct DetectionThresholds
 * @brief Tunable limits of the time, brute-force and correlation checks
 */
struct DetectionThresholds {
    int business_hours_start{6};                      ///< Hours before this are after-hours
    int business_hours_end{22};                       ///< Hours after this are after-hours
    std::size_t brute_force_failures{3};              ///< Finding when failures exceed this
    std::chrono::minutes brute_force_window{60};      ///< Failure time window
    std::size_t brute_force_lookback{100};            ///< Preceding events examined
    std::size_t high_activity_events{1000};           ///< Per-user volume limit
    std::size_t shared_ip_events{500};                ///< Per-IP volume limit
    std::size_t shared_ip_users{10};                  ///< Distinct users per IP limit
};

/**
 * @class DetectionConfig
 * @brief Load-once, read-many detection configuration
 *
 * **Usage Example**:
 * @code
 * auto config = DetectionConfig::LoadFromDirectory("config/blacklists");
 * if (auto hit = config->MatchApplication("Microsoft Azure CLI")) {
 *     spdlog::warn("Denylisted app: {}", hit->value);
 * }
 * @endcode
 */
class DetectionConfig {
public:
    DetectionConfig(std::vector<BlacklistEntry> applications,
                    std::vector<BlacklistEntry> countries,
                    std::vector<BlacklistEntry> user_agents,
                    DetectionThresholds thresholds = {});

    DetectionConfig(const DetectionConfig&) = delete;
    DetectionConfig& operator=(const DetectionConfig&) = delete;

    /**
     * @brief Load denylists from a directory
     *
     * Missing files are logged at warn level and leave that list empty.
     *
     * @param directory Directory holding the `*-Blacklist.csv` files
     * @param thresholds Detection thresholds
     * @return Shared immutable configuration
     * @throws std::runtime_error if a present file cannot be read
     */
    static std::shared_ptr<const DetectionConfig> LoadFromDirectory(
        const std::filesystem::path& directory,
        DetectionThresholds thresholds = {});

    /**
     * @brief Configuration with empty denylists
     */
    static std::shared_ptr<const DetectionConfig> Empty(DetectionThresholds thresholds = {});

    /**
     * @brief Load one denylist CSV
     * @param file CSV file with a header row
     * @param column Header of the value column
     * @return Entries in file order (rows with an empty value are skipped)
     * @throws std::runtime_error if the file cannot be opened or lacks the column
     */
    static std::vector<BlacklistEntry> LoadCsv(const std::filesystem::path& file,
                                               const std::string& column);

    // First matching entry, or std::nullopt. "Unknown" never matches.
    std::optional<BlacklistEntry> MatchApplication(const std::string& application) const;
    std::optional<BlacklistEntry> MatchCountry(const std::string& location) const;
    std::optional<BlacklistEntry> MatchUserAgent(const std::string& user_agent) const;

    const DetectionThresholds& Thresholds() const { return thresholds_; }

    std::size_t ApplicationCount() const { return applications_.size(); }
    std::size_t CountryCount() const { return countries_.size(); }
    std::size_t UserAgentCount() const { return user_agents_.size(); }

private:
    static std::optional<BlacklistEntry> Match(const std::vector<BlacklistEntry>& list,
                                               const std::string& value);

    const std::vector<BlacklistEntry> applications_;
    const std::vector<BlacklistEntry> countries_;
    const std::vector<BlacklistEntry> user_agents_;
    const DetectionThresholds thresholds_;
};

} // namespace analyzers
} // namespace auditlens
