/**
 * @file detection_config.cpp
 * @brief Denylist CSV loading and matching
 *
 * @date 2025
 */

#include "auditlens/analyzers/detection_config.hpp"
#include "auditlens/analyzers/event_normalizer.hpp"
#include "auditlens/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace auditlens {
namespace analyzers {

using utils::StringUtils;

namespace {

const char* const kApplicationFile = "Application-Blacklist.csv";
const char* const kCountryFile = "Country-Blacklist.csv";
const char* const kUserAgentFile = "UserAgent-Blacklist.csv";

std::vector<BlacklistEntry> LoadOptional(const std::filesystem::path& directory,
                                         const char* file_name,
                                         const std::string& column) {
    auto path = directory / file_name;
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Denylist not found, skipping: {}", path.string());
        return {};
    }

    auto entries = DetectionConfig::LoadCsv(path, column);
    spdlog::info("Loaded {} denylist: {} entries", column, entries.size());
    return entries;
}

} // anonymous namespace

DetectionConfig::DetectionConfig(std::vector<BlacklistEntry> applications,
                                 std::vector<BlacklistEntry> countries,
                                 std::vector<BlacklistEntry> user_agents,
                                 DetectionThresholds thresholds)
    : applications_(std::move(applications))
    , countries_(std::move(countries))
    , user_agents_(std::move(user_agents))
    , thresholds_(thresholds) {
}

std::shared_ptr<const DetectionConfig> DetectionConfig::LoadFromDirectory(
    const std::filesystem::path& directory,
    DetectionThresholds thresholds) {

    spdlog::info("Loading denylists from {}", directory.string());

    if (!std::filesystem::is_directory(directory)) {
        spdlog::warn("Denylist directory does not exist: {}", directory.string());
        return Empty(thresholds);
    }

    return std::make_shared<const DetectionConfig>(
        LoadOptional(directory, kApplicationFile, "AppDisplayName"),
        LoadOptional(directory, kCountryFile, "Country"),
        LoadOptional(directory, kUserAgentFile, "UserAgent"),
        thresholds);
}

std::shared_ptr<const DetectionConfig> DetectionConfig::Empty(DetectionThresholds thresholds) {
    return std::make_shared<const DetectionConfig>(
        std::vector<BlacklistEntry>{}, std::vector<BlacklistEntry>{},
        std::vector<BlacklistEntry>{}, thresholds);
}

std::vector<BlacklistEntry> DetectionConfig::LoadCsv(const std::filesystem::path& file,
                                                     const std::string& column) {
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Failed to open denylist: " + file.string());
    }

    std::string line;
    if (!std::getline(input, line)) {
        return {};
    }

    auto header = StringUtils::ParseCsvLine(StringUtils::StripBom(line));
    std::optional<std::size_t> value_index;
    std::optional<std::size_t> reason_index;

    for (std::size_t i = 0; i < header.size(); ++i) {
        std::string name = StringUtils::Trim(header[i]);
        if (name == column) {
            value_index = i;
        } else if (name == "Reason") {
            reason_index = i;
        }
    }

    if (!value_index) {
        throw std::runtime_error("Denylist " + file.string() + " has no column " + column);
    }

    std::vector<BlacklistEntry> entries;
    while (std::getline(input, line)) {
        if (StringUtils::Trim(line).empty()) {
            continue;
        }

        auto fields = StringUtils::ParseCsvLine(line);
        if (*value_index >= fields.size()) {
            continue;
        }

        BlacklistEntry entry;
        entry.value = StringUtils::Trim(fields[*value_index]);
        if (entry.value.empty()) {
            continue;
        }
        if (reason_index && *reason_index < fields.size()) {
            entry.reason = StringUtils::Trim(fields[*reason_index]);
        }
        entries.push_back(std::move(entry));
    }

    return entries;
}

std::optional<BlacklistEntry> DetectionConfig::Match(const std::vector<BlacklistEntry>& list,
                                                     const std::string& value) {
    if (value == kUnknown || value.empty()) {
        return std::nullopt;
    }

    for (const auto& entry : list) {
        if (entry.value == kUnknown) {
            continue;
        }
        if (StringUtils::ContainsIgnoreCase(value, entry.value)) {
            return entry;
        }
    }
    return std::nullopt;
}

std::optional<BlacklistEntry> DetectionConfig::MatchApplication(const std::string& application) const {
    return Match(applications_, application);
}

std::optional<BlacklistEntry> DetectionConfig::MatchCountry(const std::string& location) const {
    return Match(countries_, location);
}

std::optional<BlacklistEntry> DetectionConfig::MatchUserAgent(const std::string& user_agent) const {
    return Match(user_agents_, user_agent);
}

} // namespace analyzers
} // namespace auditlens
