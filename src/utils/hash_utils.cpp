/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 content digests
 *
 * Uses the OpenSSL EVP digest interface. The low-level SHA256_* functions are
 * deprecated in OpenSSL 3, EVP works across 1.1 and 3.x.
 *
 * @date 2025
 */

#include "auditlens/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <memory>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <algorithm>

namespace auditlens {
namespace utils {

namespace {

// ============================================================================
// INTERNAL HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Convert binary data to hexadecimal string
 * @param data Binary data buffer
 * @param length Number of bytes to convert
 * @return Lowercase hexadecimal string representation
 */
std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // anonymous namespace

std::string HashUtils::SHA256(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_length) != 1) {
        throw std::runtime_error("SHA-256 computation failed");
    }

    return BinaryToHex(hash, hash_length);
}

std::string HashUtils::SHA256Prefix(const std::string& data, std::size_t length) {
    std::string digest = SHA256(data);
    return digest.substr(0, std::min(length, digest.size()));
}

} // namespace utils
} // namespace auditlens
