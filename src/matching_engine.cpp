/**
 * @file matching_engine.cpp
 * @brief Per-symbol matching engine with price-time priority
 *
 * Each matching engine:
 * - Owns the order book of one symbol (single writer)
 * - Assigns order ids and trade ids, monotonically increasing per symbol
 * - Matches incoming orders against the opposite side, best price first,
 *   FIFO within a price level
 * - Rests any unfilled remainder at its limit price
 * - Reports every trade synchronously through the trade callback, which
 *   the exchange wires to the position ledger of the same shard
 */

#include "shardex/matching_engine.hpp"
#include "shardex/logger.hpp"
#include <algorithm>

namespace shardex {

EngineStats& EngineStats::operator+=(const EngineStats& other) {
    orders_processed += other.orders_processed;
    orders_rejected += other.orders_rejected;
    orders_cancelled += other.orders_cancelled;
    trades_executed += other.trades_executed;
    volume_traded += other.volume_traded;
    return *this;
}

/**
 * @brief Matching engine constructor
 * @param symbol Symbol configuration (tick and lot size)
 * @param pool_capacity Maximum simultaneously resting orders
 * @param cb Invoked once per trade, inside the caller's critical section
 */
MatchingEngine::MatchingEngine(const SymbolConfig& symbol, size_t pool_capacity, TradeCallback cb)
    : config_(symbol), symbol_(symbol.symbol),
      book_(symbol.symbol, symbol.tick_size, pool_capacity),
      trade_callback_(std::move(cb)) {
    LOG_INFO_SAFE("Matching engine created for {} (tick {}, lot {}, capacity {})",
                  symbol_, config_.tick_size, config_.lot_size, pool_capacity);
}

Result<void> MatchingEngine::check_order(const NewOrder& request) const {
    if (request.symbol != symbol_) {
        return ErrorCode::ORDER_INVALID;
    }
    if (!book_.is_valid_price(request.price)) {
        return ErrorCode::ORDER_INVALID;
    }
    if (request.quantity <= 0 || request.quantity % config_.lot_size != 0) {
        return ErrorCode::ORDER_INVALID;
    }
    return Result<void>();
}

Result<void> MatchingEngine::validate(const NewOrder& request) {
    auto valid = check_order(request);
    if (valid.has_error()) {
        orders_rejected_.add();
        LOG_DEBUG_SAFE("Rejected {} {} {}@{}: {}", to_string(request.side), request.symbol,
                       request.quantity, request.price, valid.error().message());
    }
    return valid;
}

/**
 * @brief Submit a limit order
 * @return Order id, final status, fills and remaining quantity
 *
 * Processing:
 * 1. Validate (symbol, positive tick-aligned price, positive lot-aligned qty)
 * 2. Refuse up front if the book has no free slot and the order crosses
 *    nothing, so a rejection never follows partial execution
 * 3. Match against the opposite side while the order crosses
 * 4. Rest the remainder (status NEW or PARTIALLY_FILLED)
 * 5. Publish trades through the callback and re-check book invariants
 */
Result<SubmitResult> MatchingEngine::submit(const NewOrder& request) {
    auto valid = validate(request);
    if (valid.has_error()) {
        return valid.error();
    }

    // A remainder left after crossing liquidity has fully evicted every maker
    // it touched, which frees at least one slot. Only an order that crosses
    // nothing can need a slot the full pool does not have.
    if (!book_.has_capacity() &&
        book_.side_of(opposite(request.side)).crossing_quantity(request.price, request.quantity) == 0) {
        orders_rejected_.add();
        LOG_WARN_SAFE("Rejected order on {}: book capacity reached", symbol_);
        return ErrorCode::MEMORY_POOL_EXHAUSTED;
    }

    Order taker(next_order_id_++, symbol_, request.client_id, request.side, request.price, request.quantity);

    SubmitResult result;
    result.order_id = taker.id;
    match(taker, result.trades);

    if (taker.remaining_quantity == 0) {
        taker.status = OrderStatus::FILLED;
    } else {
        taker.status = taker.filled_quantity() > 0 ? OrderStatus::PARTIALLY_FILLED : OrderStatus::NEW;
        auto rested = book_.add_resting_order(taker);
        if (rested.has_error()) {
            LOG_ERROR_SAFE("Failed to rest order {} on {}: {}", taker.id, symbol_, rested.error().message());
            return ErrorCode::INTERNAL_INVARIANT_VIOLATION;
        }
    }

    result.status = taker.status;
    result.filled_quantity = taker.filled_quantity();
    result.remaining_quantity = taker.remaining_quantity;
    orders_processed_.add();

    for (const auto& trade : result.trades) {
        trades_executed_.add();
        volume_traded_.add(static_cast<uint64_t>(trade.quantity));
        if (trade_callback_) {
            trade_callback_(trade);
        }
    }

    auto invariants = book_.check_touched(taker.side, taker.price);
    if (invariants.has_error()) {
        return invariants.error();
    }

    return result;
}

/**
 * @brief Walk the opposite side while the taker crosses
 *
 * One trade per maker order touched, always at the maker's price. Levels
 * are consumed best first and each level front to back.
 */
void MatchingEngine::match(Order& taker, std::vector<Trade>& trades) {
    BookSide& makers = book_.side_of(opposite(taker.side));

    while (taker.remaining_quantity > 0 && makers.crossed_by(taker.price)) {
        PriceLevel* level = makers.best_level();
        const Order* maker = level->orders.front();

        Quantity qty = std::min(taker.remaining_quantity, maker->remaining_quantity);
        taker.remaining_quantity -= qty;

        trades.emplace_back(next_trade_id_++, taker.id, maker->id, symbol_, taker.side,
                            taker.client_id, maker->client_id, level->price, qty);

        // May evict the maker and prune the level
        book_.fill_front(makers.side(), qty);
    }
}

/**
 * @brief Cancel a resting order
 * @return ORDER_NOT_FOUND if it already filled or was already cancelled
 *
 * Losing the race against a fill is an expected outcome; repeating a
 * cancel is harmless.
 */
Result<void> MatchingEngine::cancel(OrderID order_id) {
    auto removed = book_.remove_order(order_id);
    if (!removed) {
        LOG_DEBUG_SAFE("Cancel of order {} on {}: not resting", order_id, symbol_);
        return ErrorCode::ORDER_NOT_FOUND;
    }

    orders_cancelled_.add();

    auto invariants = book_.check_touched(removed->side, removed->price);
    if (invariants.has_error()) {
        return invariants.error();
    }
    return Result<void>();
}

EngineStats MatchingEngine::stats() const {
    EngineStats stats;
    stats.orders_processed = orders_processed_.get();
    stats.orders_rejected = orders_rejected_.get();
    stats.orders_cancelled = orders_cancelled_.get();
    stats.trades_executed = trades_executed_.get();
    stats.volume_traded = volume_traded_.get();
    return stats;
}

} // namespace shardex
