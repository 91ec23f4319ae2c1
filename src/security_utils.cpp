/**
 * @file security_utils.cpp
 * @brief Input hygiene helpers shared by logging and configuration
 *
 * Provides:
 * - Log injection prevention (CWE-117)
 * - Symbol validation (whitelist approach)
 * - SHA-256 digests for configuration integrity checks
 */

#include "shardex/security_utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace shardex {

// Control characters to filter (security: prevent injection)
const std::unordered_set<char> SecurityUtils::CONTROL_CHARS = {
    '\x00', '\x01', '\x02', '\x03', '\x04', '\x05', '\x06', '\x07',
    '\x08', '\x0B', '\x0C', '\x0E', '\x0F', '\x10', '\x11', '\x12',
    '\x13', '\x14', '\x15', '\x16', '\x17', '\x18', '\x19', '\x1A',
    '\x1B', '\x1C', '\x1D', '\x1E', '\x1F', '\x7F'
};

/**
 * @brief Sanitize input for logging (prevent log injection)
 * @param input Raw input string
 * @return Sanitized string safe for logging
 *
 * - Removes control characters
 * - Escapes newlines, carriage returns, tabs
 * - Escapes backslashes and quotes
 */
std::string SecurityUtils::sanitize_log_input(std::string_view input) {
    std::string sanitized;
    sanitized.reserve(input.size() * 2);

    for (char c : input) {
        switch (c) {
            case '\n': sanitized += "\\n"; continue;
            case '\r': sanitized += "\\r"; continue;
            case '\t': sanitized += "\\t"; continue;
            case '\\': sanitized += "\\\\"; continue;
            case '"':  sanitized += "\\\""; continue;
            default: break;
        }

        if (CONTROL_CHARS.contains(c)) {
            continue;
        }
        sanitized += c;
    }

    return sanitized;
}

/**
 * @brief Validate trading symbol
 * @return true for 1-10 characters, uppercase letter first, then A-Z, 0-9, '.' or '-'
 */
bool SecurityUtils::is_valid_symbol(std::string_view symbol) {
    if (symbol.empty() || symbol.size() > 10) return false;
    if (!std::isupper(static_cast<unsigned char>(symbol.front()))) return false;

    return std::all_of(symbol.begin(), symbol.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isupper(uc) || std::isdigit(uc) || c == '.' || c == '-';
    });
}

bool SecurityUtils::is_safe_string(std::string_view input) {
    return std::none_of(input.begin(), input.end(),
                       [](char c) { return CONTROL_CHARS.contains(c); });
}

/**
 * @brief Compute SHA-256 digest of data as lowercase hex
 *
 * Uses the OpenSSL EVP digest interface. Returns an empty string if any
 * EVP call fails so callers can treat it as an integrity failure.
 */
std::string SecurityUtils::sha256_hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return "";
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string result;
    result.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        result += HEX[hash[i] >> 4];
        result += HEX[hash[i] & 0x0F];
    }
    return result;
}

} // namespace shardex
