/**
 * @file event_normalizer.hpp
 * @brief Canonicalization of heterogeneous cloud-tenant audit records
 *
 * Audit events reach the analyzer in several shapes: Microsoft Graph
 * directory audits (`activityDisplayName`, `initiatedBy.user.*`), unified
 * audit log / PowerShell exports (`Operation`, `UserId`, `ClientIP`) and
 * sign-in style exports (`AppDisplayName`, `Country`). The normalizer maps
 * each of them onto one NormalizedEvent record so that every detection rule
 * reads the same field names.
 *
 * **Identity synthesis**:
 * When no user field is present, an identity is synthesized from the best
 * available correlator, in priority order: session id, IP address,
 * application, timestamp. Synthesized identities carry their strategy so
 * data-quality statistics never have to parse rendered names.
 *
 * Normalization is a pure function of the raw record: the same record
 * always yields the same NormalizedEvent (ids and salts are content digests).
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>

#include <nlohmann/json.hpp>

#include "auditlens/utils/time_utils.hpp"

namespace auditlens {
namespace analyzers {

/// Sentinel for absent text fields
inline const std::string kUnknown = "Unknown";

/**
 * @enum IdentityStrategy
 * @brief How the acting user of an event was determined
 */
enum class IdentityStrategy {
    REAL,           ///< Explicit user field present
    SESSION,        ///< Synthesized from the session / correlation id
    IP,             ///< Synthesized from the client IP address
    APPLICATION,    ///< Synthesized from the calling application
    TIMESTAMP       ///< Synthesized from the timestamp plus a content salt
};

std::string IdentityStrategyToString(IdentityStrategy strategy);

/**
 * @struct Identity
 * @brief Tagged user identity
 *
 * `seed` is the user name for REAL identities and the correlator value for
 * synthesized ones. Render() produces the display form used in findings:
 * the name itself, or `Unknown_Session_<seed>`, `Unknown_IP_<seed>`,
 * `Unknown_App_<seed>`, `Unknown_Time_<seed>`.
 */
struct Identity {
    IdentityStrategy strategy{IdentityStrategy::REAL};
    std::string seed;

    static Identity Real(const std::string& name);
    static Identity Synthetic(IdentityStrategy strategy, const std::string& seed);

    bool IsUnknown() const { return strategy != IdentityStrategy::REAL; }
    std::string Render() const;

    bool operator==(const Identity& other) const {
        return strategy == other.strategy && seed == other.seed;
    }
    bool operator!=(const Identity& other) const { return !(*this == other); }
};

/**
 * @struct NormalizedEvent
 * @brief Canonical view of one raw audit record
 *
 * Text fields absent from the source record hold kUnknown.
 */
struct NormalizedEvent {
    std::string id;                                ///< Source id or `event_<digest>`
    std::optional<utils::TimePoint> timestamp;     ///< Absent if missing or unparsable
    Identity user;                                 ///< Acting identity (never empty)
    std::string operation{kUnknown};
    std::string result{kUnknown};
    std::string ip_address{kUnknown};
    std::string user_agent{kUnknown};
    std::string application{kUnknown};
    std::string location{kUnknown};
    std::string category{kUnknown};
    std::string session_id{kUnknown};
    nlohmann::json target_resources = nlohmann::json::array();
    nlohmann::json additional_details = nlohmann::json::array();
    nlohmann::json raw;                            ///< Source payload

    /// Rendered user name (see Identity::Render)
    std::string UserName() const { return user.Render(); }

    bool operator==(const NormalizedEvent& other) const;
    bool operator!=(const NormalizedEvent& other) const { return !(*this == other); }
};

/**
 * @class EventNormalizer
 * @brief Maps raw audit records onto NormalizedEvent
 *
 * **Usage Example**:
 * @code
 * nlohmann::json raw = {
 *     {"Operation", "Add member to role."},
 *     {"UserId", "alice@contoso.com"},
 *     {"CreationTime", "2024-03-04T10:15:00Z"},
 *     {"ResultStatus", "Success"}
 * };
 * NormalizedEvent event = EventNormalizer::Normalize(raw);
 * // event.UserName() == "alice@contoso.com"
 * @endcode
 */
class EventNormalizer {
public:
    /**
     * @brief Normalize one raw record
     * @param raw Raw audit record (JSON object; other JSON values yield an all-Unknown event)
     * @return Canonical event
     */
    static NormalizedEvent Normalize(const nlohmann::json& raw);

    /**
     * @brief Result values counted as success ("success", "Success")
     */
    static bool IsSuccess(const std::string& result);

    /**
     * @brief Result values counted as failure ("failure", "Failure", "failed")
     */
    static bool IsFailure(const std::string& result);
};

} // namespace analyzers
} // namespace auditlens
