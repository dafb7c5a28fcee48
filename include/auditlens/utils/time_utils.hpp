/**
 * @file time_utils.hpp
 * @brief Timestamp parsing, formatting and local-calendar helpers
 *
 * Audit exports carry timestamps as ISO-8601 strings (Graph API:
 * `2024-03-02T23:15:00Z`, unified audit log: `2024-03-02T23:15:00` or
 * `2024-03-02 23:15:00`) or as epoch milliseconds. These helpers turn them
 * into `std::chrono::system_clock::time_point` values and back.
 *
 * Time-anomaly rules evaluate the hour and day of week in the analysis
 * host's local time zone (LocalHour / LocalWeekday).
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace auditlens {
namespace utils {

using TimePoint = std::chrono::system_clock::time_point;

class TimeUtils {
public:
    /**
     * @brief Parse an ISO-8601 date-time string
     *
     * Accepted forms:
     * - `YYYY-MM-DD` (local midnight)
     * - `YYYY-MM-DDTHH:MM[:SS[.fff]]` and the same with a space separator
     * - any of the above followed by `Z` or a `+HH:MM` / `-HH:MM` / `+HHMM` offset
     *
     * Strings without a zone designator are interpreted in local time.
     *
     * @param text Timestamp text
     * @return Parsed time point, or std::nullopt if malformed or outside the
     *         range of TimePoint (roughly 1677 to 2262)
     */
    static std::optional<TimePoint> ParseIso8601(const std::string& text);

    /**
     * @brief Format as UTC ISO-8601 with milliseconds (`2024-03-02T23:15:00.000Z`)
     */
    static std::string FormatIso8601(const TimePoint& time);

    /**
     * @brief Check that an epoch offset in milliseconds fits in a TimePoint
     */
    static bool IsRepresentable(std::int64_t millis);

    /**
     * @throws std::out_of_range if `millis` is not representable
     */
    static TimePoint FromEpochMillis(std::int64_t millis);
    static std::int64_t ToEpochMillis(const TimePoint& time);

    /**
     * @brief Hour of day (0-23) in the local time zone
     */
    static int LocalHour(const TimePoint& time);

    /**
     * @brief Day of week (0 = Sunday ... 6 = Saturday) in the local time zone
     */
    static int LocalWeekday(const TimePoint& time);

    /**
     * @brief Current wall-clock time
     */
    static TimePoint Now();
};

} // namespace utils
} // namespace auditlens
