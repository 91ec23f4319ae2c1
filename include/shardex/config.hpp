#pragma once

#include "shardex/types.hpp"
#include "shardex/error_handling.hpp"
#include <string>
#include <vector>
#include <memory>

namespace shardex {

struct SymbolConfig {
    std::string symbol;
    Price tick_size{1};
    Quantity lot_size{1};
    Quantity max_position{0};  // Absolute net position per client, 0 = unlimited
};

struct EngineConfig {
    std::string name{"shardex"};
    uint32_t shard_count{4};
    uint32_t snapshot_depth{10};
    uint32_t order_pool_size{65536};  // Per symbol
    uint32_t lock_timeout_ms{0};      // 0 = block until the shard is free
};

struct RiskConfig {
    Quantity max_order_size{1'000'000};
};

struct LoggingConfig {
    std::string level{"INFO"};
    uint32_t rate_limit_ms{0};
    bool enable_structured{false};
};

struct Config {
    EngineConfig engine;
    std::vector<SymbolConfig> symbols;
    RiskConfig risk;
    LoggingConfig logging;

    // Throws std::runtime_error on unreadable, malformed, tampered or invalid files.
    // Missing, tampered and invalid files throw std::system_error carrying
    // FILE_NOT_FOUND, CONFIG_INTEGRITY_FAILED or the validation error.
    static std::unique_ptr<Config> load_from_file(const std::string& path);
    static std::unique_ptr<Config> parse(const std::string& content);

    // Three liquid symbols with unit ticks, used by tools and tests
    static Config defaults();

    Result<void> validate() const;
    const SymbolConfig* find_symbol(const std::string& symbol) const;

    // Applies logging level/rate limit/format to the Logger singleton
    void apply_logging() const;
};

} // namespace shardex
