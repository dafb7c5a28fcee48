/**
 * @file mitre_catalog.hpp
 * @brief Static MITRE ATT&CK and remediation lookup keyed by detection type
 *
 * Every finding carries a tactic/technique/sub-technique mapping and an
 * ordered recommendation list. Both are looked up by detection type
 * (e.g. "mfa_disable", "brute_force"). Types without an entry fall back to
 * Defense Evasion / T1562 / T1562.001 and a generic investigate / verify /
 * monitor list.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <cstddef>

#include "auditlens/analyzers/analysis_types.hpp"

namespace auditlens {
namespace analyzers {

/**
 * @class MitreCatalog
 * @brief Immutable detection-type lookup table
 *
 * Built once in the constructor; all accessors are const and thread-safe.
 */
class MitreCatalog {
public:
    MitreCatalog();

    /**
     * @brief ATT&CK mapping for a detection type (fallback if unmapped)
     */
    MitreMapping MappingFor(const std::string& type) const;

    /**
     * @brief Recommendation list for a detection type (fallback if unmapped)
     */
    std::vector<std::string> RecommendationsFor(const std::string& type) const;

    std::size_t GetMappingCount() const { return mappings_.size(); }

private:
    void BuildMappingTable();

    std::unordered_map<std::string, MitreMapping> mappings_;
    std::unordered_map<std::string, std::vector<std::string>> recommendations_;
};

} // namespace analyzers
} // namespace auditlens
