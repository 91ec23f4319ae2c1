#include "shardex/config.hpp"
#include "shardex/logger.hpp"
#include "shardex/security_utils.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace shardex {

// Minimal JSON key extractor for the flat config layout.
// Keys are looked up inside the enclosing section text, so identical key
// names in different sections do not collide.
class JsonParser {
public:
    static std::unique_ptr<Config> parse(const std::string& content) {
        auto config = std::make_unique<Config>();

        auto engine = extract_section(content, "engine", '{', '}');
        config->engine.name = extract_string(engine, "name", config->engine.name);
        config->engine.shard_count = extract_uint32(engine, "shard_count", config->engine.shard_count);
        config->engine.snapshot_depth = extract_uint32(engine, "snapshot_depth", config->engine.snapshot_depth);
        config->engine.order_pool_size = extract_uint32(engine, "order_pool_size", config->engine.order_pool_size);
        config->engine.lock_timeout_ms = extract_uint32(engine, "lock_timeout_ms", config->engine.lock_timeout_ms);

        auto risk = extract_section(content, "risk", '{', '}');
        config->risk.max_order_size = extract_int64(risk, "max_order_size", config->risk.max_order_size);

        auto logging = extract_section(content, "logging", '{', '}');
        config->logging.level = extract_string(logging, "level", config->logging.level);
        config->logging.rate_limit_ms = extract_uint32(logging, "rate_limit_ms", config->logging.rate_limit_ms);
        config->logging.enable_structured = extract_bool(logging, "enable_structured", config->logging.enable_structured);

        auto symbols = extract_section(content, "symbols", '[', ']');
        size_t pos = 0;
        while ((pos = symbols.find('{', pos)) != std::string::npos) {
            auto end = symbols.find('}', pos);
            if (end == std::string::npos) {
                throw std::runtime_error("Unterminated symbol entry");
            }
            auto entry = symbols.substr(pos, end - pos + 1);

            SymbolConfig symbol;
            symbol.symbol = extract_string(entry, "symbol", "");
            symbol.tick_size = extract_int64(entry, "tick_size", symbol.tick_size);
            symbol.lot_size = extract_int64(entry, "lot_size", symbol.lot_size);
            symbol.max_position = extract_int64(entry, "max_position", symbol.max_position);
            config->symbols.push_back(std::move(symbol));

            pos = end + 1;
        }

        return config;
    }

private:
    static std::string extract_section(const std::string& json, const std::string& key, char open, char close) {
        auto pos = json.find("\"" + key + "\"");
        if (pos == std::string::npos) return "";

        auto start = json.find(open, pos);
        if (start == std::string::npos) return "";

        int depth = 0;
        for (size_t i = start; i < json.size(); ++i) {
            if (json[i] == open) ++depth;
            else if (json[i] == close && --depth == 0) {
                return json.substr(start, i - start + 1);
            }
        }
        throw std::runtime_error("Unterminated section: " + key);
    }

    static size_t find_value(const std::string& json, const std::string& key) {
        auto pos = json.find("\"" + key + "\"");
        if (pos == std::string::npos) return std::string::npos;

        pos = json.find(':', pos);
        if (pos == std::string::npos) return std::string::npos;

        ++pos;
        while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
        return pos < json.size() ? pos : std::string::npos;
    }

    static std::string extract_string(const std::string& json, const std::string& key, const std::string& fallback) {
        auto pos = find_value(json, key);
        if (pos == std::string::npos) return fallback;
        if (json[pos] != '"') {
            throw std::runtime_error("Expected string value for key: " + key);
        }

        auto end = json.find('"', pos + 1);
        if (end == std::string::npos) {
            throw std::runtime_error("Unterminated string for key: " + key);
        }
        return json.substr(pos + 1, end - pos - 1);
    }

    static uint32_t extract_uint32(const std::string& json, const std::string& key, uint32_t fallback) {
        auto value = extract_int64(json, key, fallback);
        if (value < 0 || value > static_cast<int64_t>(UINT32_MAX)) {
            throw std::runtime_error("Value out of range for key: " + key);
        }
        return static_cast<uint32_t>(value);
    }

    static int64_t extract_int64(const std::string& json, const std::string& key, int64_t fallback) {
        auto pos = find_value(json, key);
        if (pos == std::string::npos) return fallback;

        auto end = pos;
        if (json[end] == '-') end++;
        while (end < json.size() && std::isdigit(static_cast<unsigned char>(json[end]))) end++;

        if (end == pos || (end == pos + 1 && json[pos] == '-')) {
            throw std::runtime_error("Expected integer value for key: " + key);
        }
        return std::stoll(json.substr(pos, end - pos));
    }

    static bool extract_bool(const std::string& json, const std::string& key, bool fallback) {
        auto pos = find_value(json, key);
        if (pos == std::string::npos) return fallback;

        if (json.compare(pos, 4, "true") == 0) return true;
        if (json.compare(pos, 5, "false") == 0) return false;
        throw std::runtime_error("Expected boolean value for key: " + key);
    }
};

std::unique_ptr<Config> Config::parse(const std::string& content) {
    return JsonParser::parse(content);
}

/**
 * @brief Load and validate configuration from a JSON file
 * @param path Config file path
 *
 * If a sidecar file "<path>.sha256" exists, its first token must equal the
 * SHA-256 of the config file contents. The environment variable
 * SHARDEX_LOG_LEVEL overrides logging.level.
 */
std::unique_ptr<Config> Config::load_from_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::system_error(make_error_code(ErrorCode::FILE_NOT_FOUND),
                                "Cannot open config file: " + SecurityUtils::sanitize_log_input(path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::system_error(make_error_code(ErrorCode::FILE_NOT_FOUND),
                                "Cannot open config file: " + SecurityUtils::sanitize_log_input(path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();

    const std::string digest_path = path + ".sha256";
    if (std::filesystem::exists(digest_path)) {
        std::ifstream digest_file(digest_path);
        std::string expected;
        digest_file >> expected;

        auto actual = SecurityUtils::sha256_hex(content);
        if (expected.empty() || actual != expected) {
            throw std::system_error(make_error_code(ErrorCode::CONFIG_INTEGRITY_FAILED),
                                    "Digest mismatch for " + SecurityUtils::sanitize_log_input(path));
        }
        LOG_DEBUG("Configuration digest verified");
    }

    std::unique_ptr<Config> config;
    try {
        config = JsonParser::parse(content);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to parse config: " + SecurityUtils::sanitize_log_input(e.what()));
    }

    if (const char* level = std::getenv("SHARDEX_LOG_LEVEL")) {
        config->logging.level = level;
    }

    auto validation = config->validate();
    if (validation.has_error()) {
        throw std::system_error(validation.error(), "Configuration validation failed");
    }

    LOG_INFO_SAFE("Loaded configuration '{}' with {} symbols across {} shards",
                  config->engine.name, config->symbols.size(), config->engine.shard_count);
    return config;
}

Config Config::defaults() {
    Config config;
    config.symbols = {
        {"AAPL", 1, 1, 0},
        {"MSFT", 1, 1, 0},
        {"GOOGL", 1, 1, 0}
    };
    return config;
}

Result<void> Config::validate() const {
    if (engine.shard_count == 0 || engine.order_pool_size == 0) {
        LOG_ERROR("Config: shard_count and order_pool_size must be positive");
        return ErrorCode::CONFIG_INVALID;
    }
    if (symbols.empty()) {
        LOG_ERROR("Config: at least one symbol is required");
        return ErrorCode::CONFIG_INVALID;
    }
    if (risk.max_order_size <= 0) {
        LOG_ERROR("Config: max_order_size must be positive");
        return ErrorCode::CONFIG_INVALID;
    }

    std::unordered_set<std::string> seen;
    for (const auto& symbol : symbols) {
        if (!SecurityUtils::is_valid_symbol(symbol.symbol)) {
            LOG_ERROR_SAFE("Config: invalid symbol '{}'", symbol.symbol);
            return ErrorCode::CONFIG_INVALID;
        }
        if (symbol.tick_size <= 0 || symbol.lot_size <= 0 || symbol.max_position < 0) {
            LOG_ERROR_SAFE("Config: invalid tick/lot/position limit for {}", symbol.symbol);
            return ErrorCode::CONFIG_INVALID;
        }
        if (!seen.insert(symbol.symbol).second) {
            LOG_ERROR_SAFE("Config: duplicate symbol {}", symbol.symbol);
            return ErrorCode::CONFIG_INVALID;
        }
    }

    return Result<void>();
}

const SymbolConfig* Config::find_symbol(const std::string& symbol) const {
    for (const auto& s : symbols) {
        if (s.symbol == symbol) return &s;
    }
    return nullptr;
}

void Config::apply_logging() const {
    auto& logger = Logger::instance();
    logger.set_level(parse_log_level(logging.level));
    logger.set_rate_limit(std::chrono::milliseconds(logging.rate_limit_ms));
    logger.enable_structured(logging.enable_structured);
}

} // namespace shardex
