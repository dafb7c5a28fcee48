/**
 * @file event_normalizer.cpp
 * @brief Implementation of the audit record normalizer
 *
 * Each canonical field is resolved by walking an ordered list of source
 * field paths (dotted paths address nested objects) and taking the first
 * value that is a non-empty string, a number or `true`.
 *
 * @date 2025
 */

#include "auditlens/analyzers/event_normalizer.hpp"
#include "auditlens/utils/hash_utils.hpp"
#include "auditlens/utils/string_utils.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>

namespace auditlens {
namespace analyzers {

using json = nlohmann::json;
using utils::HashUtils;
using utils::StringUtils;
using utils::TimeUtils;

namespace {

// ============================================================================
// SOURCE FIELD TABLES
// ============================================================================
// Graph API directory audit names first, then unified audit log names

const std::initializer_list<const char*> kIdFields = {"id", "Id"};

const std::initializer_list<const char*> kTimestampFields = {
    "activityDateTime", "CreationTime", "TimeGenerated", "Timestamp"
};

const std::initializer_list<const char*> kUserFields = {
    "initiatedBy.user.userPrincipalName", "initiatedBy.user.displayName",
    "UserId", "UserPrincipalName", "UserDisplayName"
};

const std::initializer_list<const char*> kOperationFields = {
    "activityDisplayName", "Operation", "ActivityDisplayName"
};

const std::initializer_list<const char*> kResultFields = {"result", "ResultStatus", "Status"};

const std::initializer_list<const char*> kIpFields = {
    "initiatedBy.user.ipAddress", "ClientIP", "IPAddress", "location.countryOrRegion"
};

const std::initializer_list<const char*> kUserAgentFields = {
    "initiatedBy.user.userAgent", "UserAgent", "ClientAppUsed"
};

const std::initializer_list<const char*> kApplicationFields = {
    "initiatedBy.app.displayName", "initiatedBy.app.appId",
    "AppDisplayName", "ApplicationId", "ClientAppUsed"
};

const std::initializer_list<const char*> kLocationFields = {
    "location.countryOrRegion", "location.city", "Country", "Location"
};

const std::initializer_list<const char*> kCategoryFields = {"category", "LogName", "RecordType"};

const std::initializer_list<const char*> kSessionFields = {
    "SessionId", "sessionId", "correlationId", "CorrelationId"
};

// ============================================================================
// FIELD RESOLUTION
// ============================================================================

/**
 * @brief Resolve a dotted path inside a JSON object
 *
 * A flat key spelled exactly like the path (CSV exports flatten nested
 * columns that way) takes precedence over the nested walk.
 *
 * @return Pointer to the value, or nullptr if any segment is missing
 */
const json* Lookup(const json& root, const std::string& path) {
    if (root.is_object()) {
        auto flat = root.find(path);
        if (flat != root.end()) {
            return &(*flat);
        }
    }

    const json* node = &root;
    for (const auto& segment : StringUtils::Split(path, '.')) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(segment);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

/**
 * @brief Scalar JSON value as text, or std::nullopt if absent, empty or falsy
 */
std::optional<std::string> AsText(const json* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        const auto& text = value->get_ref<const std::string&>();
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    if (value->is_number_integer() || value->is_number_unsigned()) {
        if (*value == 0) {
            return std::nullopt;
        }
        return value->dump();
    }
    if (value->is_number_float()) {
        double number = value->get<double>();
        if (number == 0.0 || number != number) {
            return std::nullopt;
        }
        return value->dump();
    }
    if (value->is_boolean() && value->get<bool>()) {
        return std::string("true");
    }
    return std::nullopt;
}

std::optional<std::string> FirstText(const json& raw,
                                     std::initializer_list<const char*> fields) {
    for (const char* field : fields) {
        if (auto text = AsText(Lookup(raw, field))) {
            return text;
        }
    }
    return std::nullopt;
}

std::string FirstTextOr(const json& raw, std::initializer_list<const char*> fields) {
    return FirstText(raw, fields).value_or(kUnknown);
}

// Out-of-range and non-finite numbers are treated as unparseable
std::optional<utils::TimePoint> EpochMillisToTime(const json& value) {
    std::int64_t millis = 0;

    if (value.is_number_unsigned()) {
        const auto unsigned_millis = value.get<std::uint64_t>();
        if (unsigned_millis > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        millis = static_cast<std::int64_t>(unsigned_millis);
    } else if (value.is_number_integer()) {
        millis = value.get<std::int64_t>();
    } else {
        const double number = value.get<double>();
        // 2^63 is exact as a double; anything at or beyond it cannot convert
        if (!std::isfinite(number) || number >= 9223372036854775808.0 ||
            number < -9223372036854775808.0) {
            return std::nullopt;
        }
        millis = static_cast<std::int64_t>(number);
    }

    if (!TimeUtils::IsRepresentable(millis)) {
        return std::nullopt;
    }
    return TimeUtils::FromEpochMillis(millis);
}

std::optional<utils::TimePoint> ResolveTimestamp(const json& raw) {
    for (const char* field : kTimestampFields) {
        const json* value = Lookup(raw, field);
        if (value == nullptr || value->is_null()) {
            continue;
        }
        if (value->is_string()) {
            const auto& text = value->get_ref<const std::string&>();
            if (text.empty()) {
                continue;
            }
            // First non-empty field wins even if it does not parse
            return TimeUtils::ParseIso8601(StringUtils::Trim(text));
        }
        if (value->is_number()) {
            return EpochMillisToTime(*value);
        }
    }
    return std::nullopt;
}

json ArrayOrEmpty(const json& raw, const char* field) {
    auto it = raw.find(field);
    if (it != raw.end() && it->is_array()) {
        return *it;
    }
    return json::array();
}

} // anonymous namespace

// ============================================================================
// IDENTITY
// ============================================================================

std::string IdentityStrategyToString(IdentityStrategy strategy) {
    switch (strategy) {
        case IdentityStrategy::REAL:        return "real";
        case IdentityStrategy::SESSION:     return "session";
        case IdentityStrategy::IP:          return "ip";
        case IdentityStrategy::APPLICATION: return "application";
        case IdentityStrategy::TIMESTAMP:   return "timestamp";
    }
    return "real";
}

Identity Identity::Real(const std::string& name) {
    return Identity{IdentityStrategy::REAL, name};
}

Identity Identity::Synthetic(IdentityStrategy strategy, const std::string& seed) {
    return Identity{strategy, seed};
}

std::string Identity::Render() const {
    switch (strategy) {
        case IdentityStrategy::REAL:        return seed;
        case IdentityStrategy::SESSION:     return "Unknown_Session_" + seed;
        case IdentityStrategy::IP:          return "Unknown_IP_" + seed;
        case IdentityStrategy::APPLICATION: return "Unknown_App_" + seed;
        case IdentityStrategy::TIMESTAMP:   return "Unknown_Time_" + seed;
    }
    return seed;
}

bool NormalizedEvent::operator==(const NormalizedEvent& other) const {
    return id == other.id &&
           timestamp == other.timestamp &&
           user == other.user &&
           operation == other.operation &&
           result == other.result &&
           ip_address == other.ip_address &&
           user_agent == other.user_agent &&
           application == other.application &&
           location == other.location &&
           category == other.category &&
           session_id == other.session_id &&
           target_resources == other.target_resources &&
           additional_details == other.additional_details &&
           raw == other.raw;
}

// ============================================================================
// NORMALIZATION
// ============================================================================

NormalizedEvent EventNormalizer::Normalize(const json& raw) {
    NormalizedEvent event;
    event.raw = raw;

    const std::string digest = HashUtils::SHA256(
        raw.dump(-1, ' ', false, json::error_handler_t::replace));

    if (!raw.is_object()) {
        event.id = "event_" + digest.substr(0, 16);
        event.user = Identity::Synthetic(IdentityStrategy::TIMESTAMP, "none_" + digest.substr(0, 8));
        return event;
    }

    event.id = FirstText(raw, kIdFields).value_or("event_" + digest.substr(0, 16));
    event.timestamp = ResolveTimestamp(raw);
    event.operation = FirstTextOr(raw, kOperationFields);
    event.result = FirstTextOr(raw, kResultFields);
    event.ip_address = FirstTextOr(raw, kIpFields);
    event.user_agent = FirstTextOr(raw, kUserAgentFields);
    event.application = FirstTextOr(raw, kApplicationFields);
    event.location = FirstTextOr(raw, kLocationFields);
    event.category = FirstTextOr(raw, kCategoryFields);
    event.session_id = FirstTextOr(raw, kSessionFields);
    event.target_resources = ArrayOrEmpty(raw, "targetResources");
    event.additional_details = ArrayOrEmpty(raw, "additionalDetails");

    // Identity fallback chain
    if (auto name = FirstText(raw, kUserFields)) {
        event.user = Identity::Real(*name);
    } else if (event.session_id != kUnknown) {
        event.user = Identity::Synthetic(IdentityStrategy::SESSION, event.session_id);
    } else if (event.ip_address != kUnknown) {
        event.user = Identity::Synthetic(IdentityStrategy::IP, event.ip_address);
    } else if (event.application != kUnknown) {
        event.user = Identity::Synthetic(IdentityStrategy::APPLICATION, event.application);
    } else {
        std::string time_part = event.timestamp
            ? std::to_string(TimeUtils::ToEpochMillis(*event.timestamp))
            : std::string("none");
        event.user = Identity::Synthetic(IdentityStrategy::TIMESTAMP,
                                         time_part + "_" + digest.substr(0, 8));
    }

    return event;
}

bool EventNormalizer::IsSuccess(const std::string& result) {
    return result == "success" || result == "Success";
}

bool EventNormalizer::IsFailure(const std::string& result) {
    return result == "failure" || result == "Failure" || result == "failed";
}

} // namespace analyzers
} // namespace auditlens
