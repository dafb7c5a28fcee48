/**
 * @file time_utils.cpp
 * @brief Implementation of timestamp helpers
 *
 * @date 2025
 */

#include "auditlens/utils/time_utils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace auditlens {
namespace utils {

namespace {

// Reads exactly `digits` decimal digits at `pos`
bool ReadNumber(const std::string& text, std::size_t& pos, std::size_t digits, int& out) {
    if (pos + digits > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += digits;
    out = value;
    return true;
}

const std::int64_t kMaxEpochMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::max()).count();
const std::int64_t kMinEpochMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::min()).count();

bool Expect(const std::string& text, std::size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

std::tm ToLocalTm(const TimePoint& time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);
    return local;
}

} // anonymous namespace

std::optional<TimePoint> TimeUtils::ParseIso8601(const std::string& text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;
    int millis = 0;

    if (!ReadNumber(text, pos, 4, year) || !Expect(text, pos, '-') ||
        !ReadNumber(text, pos, 2, month) || !Expect(text, pos, '-') ||
        !ReadNumber(text, pos, 2, day)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
        ++pos;
        if (!ReadNumber(text, pos, 2, hour) || !Expect(text, pos, ':') ||
            !ReadNumber(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (Expect(text, pos, ':')) {
            if (!ReadNumber(text, pos, 2, second)) {
                return std::nullopt;
            }
            if (Expect(text, pos, '.')) {
                // Fractional seconds: keep millisecond precision, skip the rest
                int scale = 100;
                std::size_t start = pos;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    if (scale > 0) {
                        millis += (text[pos] - '0') * scale;
                        scale /= 10;
                    }
                    ++pos;
                }
                if (pos == start) {
                    return std::nullopt;
                }
            }
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    std::time_t epoch = 0;

    if (pos == text.size()) {
        // No zone designator: local time
        tm.tm_isdst = -1;
        epoch = std::mktime(&tm);
    } else if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
        epoch = timegm(&tm);
    } else if (text[pos] == '+' || text[pos] == '-') {
        int sign = (text[pos] == '-') ? -1 : 1;
        ++pos;
        int offset_hours = 0, offset_minutes = 0;
        if (!ReadNumber(text, pos, 2, offset_hours)) {
            return std::nullopt;
        }
        Expect(text, pos, ':');
        if (pos < text.size() && !ReadNumber(text, pos, 2, offset_minutes)) {
            return std::nullopt;
        }
        epoch = timegm(&tm) - sign * (offset_hours * 3600 + offset_minutes * 60);
    } else {
        return std::nullopt;
    }

    if (pos != text.size() || epoch == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    // Sentinels such as 9999-12-31 do not fit in nanosecond ticks
    const std::int64_t epoch_seconds = static_cast<std::int64_t>(epoch);
    if (epoch_seconds > kMaxEpochMillis / 1000 - 1 || epoch_seconds < kMinEpochMillis / 1000 + 1) {
        return std::nullopt;
    }

    return FromEpochMillis(epoch_seconds * 1000 + millis);
}

std::string TimeUtils::FormatIso8601(const TimePoint& time) {
    auto millis_total = ToEpochMillis(time);
    auto seconds = millis_total / 1000;
    auto millis = millis_total % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

bool TimeUtils::IsRepresentable(std::int64_t millis) {
    return millis >= kMinEpochMillis && millis <= kMaxEpochMillis;
}

TimePoint TimeUtils::FromEpochMillis(std::int64_t millis) {
    if (!IsRepresentable(millis)) {
        throw std::out_of_range("Epoch milliseconds out of range: " + std::to_string(millis));
    }
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(millis)));
}

std::int64_t TimeUtils::ToEpochMillis(const TimePoint& time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count();
}

int TimeUtils::LocalHour(const TimePoint& time) {
    return ToLocalTm(time).tm_hour;
}

int TimeUtils::LocalWeekday(const TimePoint& time) {
    return ToLocalTm(time).tm_wday;
}

TimePoint TimeUtils::Now() {
    return std::chrono::system_clock::now();
}

} // namespace utils
} // namespace auditlens
