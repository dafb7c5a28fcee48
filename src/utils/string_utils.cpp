/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation utilities
 *
 * Implements the trimming, case folding, splitting and matching helpers used
 * across the analysis pipeline, plus a small RFC 4180 CSV record parser used
 * by the blacklist and audit-log loaders.
 *
 * @date 2025
 */

#include "auditlens/utils/string_utils.hpp"

#include <sstream>
#include <algorithm>
#include <cctype>

namespace auditlens {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================
// Basic string operations: trimming, casing, splitting, replacing

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

// Replace all occurrences
std::string StringUtils::ReplaceAll(const std::string& str,
                                   const std::string& from,
                                   const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

// ============================================================================
// STRING TESTS
// ============================================================================

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    if (substring.empty()) {
        return false;
    }

    auto it = std::search(str.begin(), str.end(), substring.begin(), substring.end(),
                          [](unsigned char a, unsigned char b) {
                              return std::tolower(a) == std::tolower(b);
                          });
    return it != str.end();
}

// ============================================================================
// CSV PARSING
// ============================================================================

std::string StringUtils::StripBom(const std::string& text) {
    if (StartsWith(text, "\xEF\xBB\xBF")) {
        return text.substr(3);
    }
    return text;
}

std::vector<std::string> StringUtils::ParseCsvLine(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    std::string input = line;
    if (!input.empty() && input.back() == '\r') {
        input.pop_back();
    }

    for (std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < input.size() && input[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == delimiter) {
            fields.push_back(field);
            field.clear();
        } else {
            field += c;
        }
    }

    fields.push_back(field);
    return fields;
}

// ============================================================================
// TRUNCATION
// ============================================================================

// Truncate string
std::string StringUtils::Truncate(const std::string& str,
                                 std::size_t max_length,
                                 const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }

    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace auditlens
