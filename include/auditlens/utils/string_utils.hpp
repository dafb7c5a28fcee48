/**
 * @file string_utils.hpp
 * @brief String manipulation utilities for audit-log processing
 *
 * Provides the string helpers shared by the normalizer, the detection rules
 * and the audit-log loaders: trimming, case folding, splitting, substring
 * checks and CSV row parsing.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace auditlens {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers for audit-log analysis
 *
 * Provides static methods for:
 * - String manipulation (trim, case, split, replace)
 * - Prefix and case-insensitive substring tests
 * - CSV row parsing (RFC 4180 quoting)
 * - Console truncation
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto fields = StringUtils::ParseCsvLine("UserId,\"Add member, to role\",Success");
 * // fields == {"UserId", "Add member, to role", "Success"}
 *
 * if (StringUtils::ContainsIgnoreCase("Microsoft Azure CLI", "azure cli")) {
 *     // blacklist hit
 * }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase (ASCII)
     * @param str Input string
     * @return Lowercase copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * Empty tokens are skipped.
     *
     * @param str Input string
     * @param delimiter Separator character
     * @return Vector of tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Replace every occurrence of a substring
     */
    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    /***************************************************************************
     * String Tests
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Case-insensitive substring test
     *
     * Used for denylist matching where entries are partial names
     * (e.g. "azure cli" matches "Microsoft Azure CLI").
     *
     * @param str Haystack
     * @param substring Needle (empty needle never matches)
     * @return true if needle occurs in haystack ignoring ASCII case
     */
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /***************************************************************************
     * CSV Parsing
     ***************************************************************************/

    /**
     * @brief Remove a leading UTF-8 byte order mark
     */
    static std::string StripBom(const std::string& text);

    /**
     * @brief Parse one CSV record
     *
     * Handles quoted fields, embedded delimiters and doubled quotes (`""`).
     * Fields are not trimmed; a trailing carriage return is dropped.
     *
     * @param line Single CSV line
     * @param delimiter Field separator (default: comma)
     * @return Field values in column order
     */
    static std::vector<std::string> ParseCsvLine(const std::string& line, char delimiter = ',');

    /***************************************************************************
     * Display Helpers
     ***************************************************************************/

    /**
     * @brief Truncate string to maximum length
     * @param str Input string
     * @param max_length Maximum length including suffix
     * @param suffix Appended when truncated (default: "...")
     * @return Truncated string
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace auditlens
