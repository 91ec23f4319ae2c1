#include "shardex/position_ledger.hpp"
#include "shardex/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace shardex {

double Position::apply_fill(Side side, Quantity qty, Price price) {
    if (qty <= 0) return 0.0;

    const Quantity signed_qty = side == Side::BUY ? qty : -qty;
    const double fill_price = static_cast<double>(price);

    // Opening from flat or adding in the same direction
    if (quantity == 0 || (quantity > 0) == (signed_qty > 0)) {
        const Quantity new_quantity = quantity + signed_qty;
        avg_price = (avg_price * static_cast<double>(std::abs(quantity)) + fill_price * static_cast<double>(qty)) /
                    static_cast<double>(std::abs(new_quantity));
        quantity = new_quantity;
        return 0.0;
    }

    // Reducing, closing or flipping
    const Quantity closed = std::min(qty, std::abs(quantity));
    const double direction = quantity > 0 ? 1.0 : -1.0;
    const double pnl = (fill_price - avg_price) * static_cast<double>(closed) * direction;
    realized_pnl += pnl;

    const Quantity new_quantity = quantity + signed_qty;
    if (new_quantity == 0) {
        avg_price = 0.0;
    } else if ((new_quantity > 0) != (quantity > 0)) {
        avg_price = fill_price;
    }
    quantity = new_quantity;
    return pnl;
}

/**
 * @brief Apply a trade to both counterparties
 *
 * The taker moves in taker_side, the maker in the opposite direction, both
 * by the trade quantity at the trade price. Called synchronously from the
 * owning shard right after the trade is produced.
 */
void PositionLedger::apply_trade(const Trade& trade, std::vector<Position>* updated) {
    std::unique_lock lock(mutex_);

    Position& taker = position_for(trade.taker_client, trade.symbol);
    double taker_pnl = taker.apply_fill(trade.taker_side, trade.quantity, trade.price);
    if (updated) updated->push_back(taker);

    Position& maker = position_for(trade.maker_client, trade.symbol);
    double maker_pnl = maker.apply_fill(opposite(trade.taker_side), trade.quantity, trade.price);
    if (updated) updated->push_back(maker);

    lock.unlock();
    trades_applied_.add();

    if (taker_pnl != 0.0 || maker_pnl != 0.0) {
        LOG_DEBUG_SAFE("Trade {} on {} realized taker {:.2f} maker {:.2f}",
                       trade.id, trade.symbol, taker_pnl, maker_pnl);
    }
}

Position& PositionLedger::position_for(ClientID client, const std::string& symbol) {
    auto [it, inserted] = positions_.try_emplace(Key{client, symbol});
    if (inserted) {
        it->second.client_id = client;
        it->second.symbol = symbol;
    }
    return it->second;
}

std::optional<Position> PositionLedger::position(ClientID client, const std::string& symbol) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(Key{client, symbol});
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

Quantity PositionLedger::net_quantity(ClientID client, const std::string& symbol) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(Key{client, symbol});
    return it == positions_.end() ? 0 : it->second.quantity;
}

double PositionLedger::unrealized_pnl(ClientID client, const std::string& symbol, double mark_price) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(Key{client, symbol});
    return it == positions_.end() ? 0.0 : it->second.unrealized_pnl(mark_price);
}

std::vector<Position> PositionLedger::positions() const {
    std::shared_lock lock(mutex_);
    std::vector<Position> result;
    result.reserve(positions_.size());
    for (const auto& [key, position] : positions_) {
        result.push_back(position);
    }
    return result;
}

std::vector<Position> PositionLedger::positions_for(const std::string& symbol) const {
    std::shared_lock lock(mutex_);
    std::vector<Position> result;
    for (const auto& [key, position] : positions_) {
        if (key.symbol == symbol) result.push_back(position);
    }
    return result;
}

} // namespace shardex
