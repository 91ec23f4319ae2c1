#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <fmt/format.h>

namespace shardex {

class SecurityUtils {
public:
    // Log input sanitization (CWE-117)
    static std::string sanitize_log_input(std::string_view input);

    // Type-safe formatting (CWE-134)
    template<typename... Args>
    static std::string safe_format(std::string_view format_str, Args&&... args) {
        try {
            return fmt::vformat(fmt::string_view(format_str.data(), format_str.size()),
                                fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            return std::string("[FORMAT_ERROR: ") + e.what() + "]";
        }
    }

    // Input validation
    static bool is_valid_symbol(std::string_view symbol);
    static bool is_safe_string(std::string_view input);

    // Lowercase hex SHA-256 digest, empty on failure
    static std::string sha256_hex(std::string_view data);

private:
    static const std::unordered_set<char> CONTROL_CHARS;
};

} // namespace shardex
