/**
 * @file mitre_catalog.cpp
 * @brief Detection-type to ATT&CK / recommendation table
 *
 * @date 2025
 */

#include "auditlens/analyzers/mitre_catalog.hpp"

namespace auditlens {
namespace analyzers {

namespace {

const MitreMapping kFallbackMapping{
    {"Defense Evasion"}, {"T1562"}, {"T1562.001"}
};

const std::vector<std::string> kFallbackRecommendations{
    "Investigate the activity",
    "Verify authorization",
    "Monitor for additional suspicious behavior"
};

} // anonymous namespace

MitreCatalog::MitreCatalog() {
    BuildMappingTable();
}

void MitreCatalog::BuildMappingTable() {
    auto add = [this](const std::string& type, MitreMapping mapping,
                      std::vector<std::string> recommendations) {
        mappings_[type] = std::move(mapping);
        if (!recommendations.empty()) {
            recommendations_[type] = std::move(recommendations);
        }
    };

    // --- Suspicious operation patterns ---

    add("password_reset",
        {{"Credential Access", "Defense Evasion"}, {"T1110", "T1556"}, {"T1110.001", "T1556.001"}},
        {"Verify the legitimacy of password reset requests",
         "Implement strong password policies",
         "Monitor for subsequent suspicious activity"});

    add("role_assignment",
        {{"Privilege Escalation", "Persistence"}, {"T1134", "T1078"}, {"T1134.001", "T1078.004"}},
        {"Review the necessity of role assignments",
         "Implement approval workflows for role changes",
         "Monitor for abuse of assigned roles"});

    add("permission_grant",
        {{"Privilege Escalation", "Persistence"}, {"T1134", "T1078"}, {"T1134.001", "T1078.004"}},
        {"Verify authorization for permission grants",
         "Implement least privilege principles",
         "Regular review of granted permissions"});

    add("user_deletion",
        {{"Impact", "Defense Evasion"}, {"T1531", "T1070"}, {"T1531.001", "T1070.004"}},
        {"Verify authorization for user deletion",
         "Ensure proper data retention policies",
         "Monitor for unauthorized deletions"});

    add("admin_consent",
        {{"Privilege Escalation", "Persistence"}, {"T1134", "T1098"}, {"T1134.001", "T1098.001"}},
        {"Review admin consent grants carefully",
         "Implement approval workflows",
         "Monitor application permissions"});

    add("mfa_disable",
        {{"Defense Evasion", "Credential Access"}, {"T1556", "T1110"}, {"T1556.006", "T1110.001"}},
        {"Immediate investigation required",
         "Re-enable MFA if unauthorized",
         "Review MFA bypass policies"});

    // --- Denylist hits ---

    add("blacklisted_application",
        {{"Initial Access", "Persistence"}, {"T1078", "T1199"}, {"T1078.004"}},
        {"Investigate the use of this blacklisted application",
         "Review user access permissions",
         "Consider blocking this application organization-wide"});

    add("blacklisted_country",
        {{"Initial Access", "Defense Evasion"}, {"T1078", "T1090"}, {"T1078.004", "T1090.003"}},
        {"Investigate the legitimacy of access from this location",
         "Verify user identity and authorization",
         "Consider implementing geo-blocking"});

    add("blacklisted_user_agent",
        {{"Defense Evasion", "Command and Control"}, {"T1071", "T1090"}, {"T1071.001"}},
        {"Investigate the use of this user agent",
         "Check for potential automated tools or bots",
         "Monitor for additional suspicious activity"});

    // --- Time anomalies ---

    add("after_hours_activity",
        {{"Defense Evasion", "Persistence"}, {"T1070", "T1562"}, {"T1070.004"}},
        {"Verify if this activity was authorized",
         "Consider implementing time-based access controls",
         "Monitor for additional suspicious activity"});

    add("weekend_activity",
        {{"Defense Evasion"}, {"T1070"}, {"T1070.004"}},
        {"Verify if weekend access was necessary",
         "Review business justification for weekend activity"});

    // --- Permission changes ---

    add("permission_change",
        {{"Privilege Escalation", "Persistence"}, {"T1134", "T1078"}, {"T1134.001", "T1078.004"}},
        {"Review the necessity of this permission change",
         "Verify authorization for this change",
         "Monitor for abuse of new permissions"});

    // --- Credential attacks ---

    add("brute_force",
        {{"Credential Access", "Initial Access"}, {"T1110", "T1078"}, {"T1110.001", "T1110.003"}},
        {"Implement account lockout policies",
         "Monitor for additional suspicious activity",
         "Consider blocking IP address if pattern continues",
         "Review MFA implementation"});

    // --- Cross-event correlation ---

    add("high_activity_user",
        {{"Collection", "Exfiltration"}, {"T1005", "T1041"}, {"T1005.001"}},
        {"Investigate the nature of high activity",
         "Verify if user behavior is legitimate",
         "Monitor for data exfiltration attempts"});

    add("shared_ip_access",
        {{"Initial Access", "Lateral Movement"}, {"T1078", "T1021"}, {"T1078.004"}},
        {"Investigate the legitimacy of shared IP usage",
         "Verify if this is a corporate network or VPN",
         "Monitor for potential account compromise"});
}

MitreMapping MitreCatalog::MappingFor(const std::string& type) const {
    auto it = mappings_.find(type);
    return it != mappings_.end() ? it->second : kFallbackMapping;
}

std::vector<std::string> MitreCatalog::RecommendationsFor(const std::string& type) const {
    auto it = recommendations_.find(type);
    return it != recommendations_.end() ? it->second : kFallbackRecommendations;
}

} // namespace analyzers
} // namespace auditlens
