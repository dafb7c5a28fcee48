/**
 * @file hash_utils.hpp
 * @brief Content digests for audit records
 *
 * SHA-256 helpers used to derive stable identifiers from raw audit records:
 * synthesized event ids (`event_<digest prefix>`) and the salt of
 * timestamp-based synthetic identities. Hashing the record content rather
 * than using random or clock-based values keeps normalization deterministic.
 *
 * **Example Usage**:
 * @code
 * std::string digest = HashUtils::SHA256("hello");
 * // "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824"
 *
 * std::string id = "event_" + HashUtils::SHA256Prefix(record.dump(), 16);
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>

namespace auditlens {
namespace utils {

/**
 * @class HashUtils
 * @brief Static SHA-256 helpers backed by OpenSSL EVP
 *
 * All functions are thread-safe and reentrant.
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a string
     * @param data Input bytes
     * @return Lowercase hex digest (64 characters)
     * @throws std::runtime_error if OpenSSL fails
     */
    static std::string SHA256(const std::string& data);

    /**
     * @brief First @p length hex characters of the SHA-256 digest
     * @param data Input bytes
     * @param length Number of hex characters to keep (clamped to 64)
     * @return Digest prefix
     */
    static std::string SHA256Prefix(const std::string& data, std::size_t length);
};

} // namespace utils
} // namespace auditlens
