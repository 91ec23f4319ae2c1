#pragma once

#include "shardex/config.hpp"
#include "shardex/error_handling.hpp"
#include "shardex/order_request.hpp"
#include "shardex/position_ledger.hpp"
#include "shardex/thread_safety.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace shardex {

enum class RiskResult {
    APPROVED,
    REJECTED_SYMBOL,
    REJECTED_INVALID,
    REJECTED_SIZE,
    REJECTED_POSITION_LIMIT
};

const char* to_string(RiskResult result);

// Pre-trade checks run inside the shard critical section, before the book
// is touched. Stateless apart from configuration and counters, so one
// instance is shared by all shards.
class RiskManager {
public:
    RiskManager(const RiskConfig& config, const std::vector<SymbolConfig>& symbols);

    RiskResult evaluate(const NewOrder& order, const PositionLedger& ledger) const;

    // Maps evaluate() onto the error taxonomy and counts rejections
    Result<void> validate_new_order(const NewOrder& order, const PositionLedger& ledger);

    bool is_known_symbol(const std::string& symbol) const { return symbol_configs_.contains(symbol); }
    const SymbolConfig* get_symbol_config(const std::string& symbol) const;

    uint64_t orders_checked() const { return orders_checked_.get(); }
    uint64_t orders_rejected() const { return orders_rejected_.get(); }

private:
    RiskConfig config_;
    std::unordered_map<std::string, SymbolConfig> symbol_configs_;

    StatCounter orders_checked_;
    StatCounter orders_rejected_;

    bool check_order_size(const NewOrder& order) const;
    bool check_position_limit(const NewOrder& order, const SymbolConfig& symbol,
                              const PositionLedger& ledger) const;
};

} // namespace shardex
