/**
 * @file risk_manager.cpp
 * @brief Pre-trade risk checks
 *
 * Checks, in order:
 * 1. Symbol is configured and quantity is positive
 * 2. Order size within max_order_size
 * 3. Worst-case resulting position within the symbol's max_position
 *
 * A rejection has no side effects on the book or the ledger.
 */

#include "shardex/risk_manager.hpp"
#include "shardex/logger.hpp"
#include <limits>

namespace shardex {

const char* to_string(RiskResult result) {
    switch (result) {
        case RiskResult::APPROVED: return "APPROVED";
        case RiskResult::REJECTED_SYMBOL: return "REJECTED_SYMBOL";
        case RiskResult::REJECTED_INVALID: return "REJECTED_INVALID";
        case RiskResult::REJECTED_SIZE: return "REJECTED_SIZE";
        case RiskResult::REJECTED_POSITION_LIMIT: return "REJECTED_POSITION_LIMIT";
    }
    return "UNKNOWN";
}

RiskManager::RiskManager(const RiskConfig& config, const std::vector<SymbolConfig>& symbols)
    : config_(config) {
    for (const auto& symbol : symbols) {
        symbol_configs_[symbol.symbol] = symbol;
    }
}

const SymbolConfig* RiskManager::get_symbol_config(const std::string& symbol) const {
    auto it = symbol_configs_.find(symbol);
    return it != symbol_configs_.end() ? &it->second : nullptr;
}

RiskResult RiskManager::evaluate(const NewOrder& order, const PositionLedger& ledger) const {
    const SymbolConfig* symbol = get_symbol_config(order.symbol);
    if (!symbol) {
        return RiskResult::REJECTED_SYMBOL;
    }

    if (order.quantity <= 0) {
        return RiskResult::REJECTED_INVALID;
    }

    if (!check_order_size(order)) {
        return RiskResult::REJECTED_SIZE;
    }

    if (!check_position_limit(order, *symbol, ledger)) {
        return RiskResult::REJECTED_POSITION_LIMIT;
    }

    return RiskResult::APPROVED;
}

Result<void> RiskManager::validate_new_order(const NewOrder& order, const PositionLedger& ledger) {
    orders_checked_.add();

    RiskResult result = evaluate(order, ledger);
    if (result == RiskResult::APPROVED) {
        return Result<void>();
    }

    orders_rejected_.add();
    LOG_DEBUG_SAFE("Risk rejected {} {} {}@{} for client {}: {}",
                   to_string(order.side), order.symbol, order.quantity, order.price,
                   order.client_id, to_string(result));

    switch (result) {
        case RiskResult::REJECTED_SYMBOL:
        case RiskResult::REJECTED_INVALID: return ErrorCode::ORDER_INVALID;
        case RiskResult::REJECTED_SIZE: return ErrorCode::RISK_LIMIT_EXCEEDED;
        case RiskResult::REJECTED_POSITION_LIMIT: return ErrorCode::POSITION_LIMIT_EXCEEDED;
        default: return ErrorCode::INTERNAL_INVARIANT_VIOLATION;
    }
}

bool RiskManager::check_order_size(const NewOrder& order) const {
    return order.quantity <= config_.max_order_size;
}

// Assumes the whole order fills, so the limit holds whatever the match yields.
// Requires a positive quantity.
bool RiskManager::check_position_limit(const NewOrder& order, const SymbolConfig& symbol,
                                       const PositionLedger& ledger) const {
    if (symbol.max_position <= 0) return true;

    constexpr Quantity max_qty = std::numeric_limits<Quantity>::max();
    constexpr Quantity min_qty = std::numeric_limits<Quantity>::min();

    Quantity current = ledger.net_quantity(order.client_id, order.symbol);
    Quantity signed_qty = order.side == Side::BUY ? order.quantity : -order.quantity;

    // A sum that would overflow is far beyond any limit
    if (signed_qty > 0 && current > max_qty - signed_qty) return false;
    if (signed_qty < 0 && current < min_qty - signed_qty) return false;

    Quantity resulting = current + signed_qty;
    return resulting <= symbol.max_position && resulting >= -symbol.max_position;
}

} // namespace shardex
