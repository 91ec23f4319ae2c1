/**
 * @file order_book.cpp
 * @brief Price-ordered resting order storage for a single symbol
 *
 * Key properties:
 * - std::map per side with a side-aware comparator, best price at begin()
 * - std::deque per price level for O(1) FIFO pop at the front
 * - Cached per-level total quantity, kept equal to the sum of remaining
 *   quantities of the level's orders
 * - Empty levels are erased the moment they empty
 * - Orders live in a pre-allocated pool, the hot path does not allocate
 *   order storage
 *
 * Thread safety: none internally. The owning shard serializes all writers;
 * readers go through the snapshot cache instead of touching the book.
 */

#include "shardex/order_book.hpp"
#include "shardex/logger.hpp"
#include <algorithm>

namespace shardex {

std::optional<Price> BookSide::best_price() const {
    if (levels_.empty()) return std::nullopt;
    return levels_.begin()->first;
}

PriceLevel* BookSide::best_level() {
    return levels_.empty() ? nullptr : &levels_.begin()->second;
}

const PriceLevel* BookSide::find_level(Price price) const {
    auto it = levels_.find(price);
    return it == levels_.end() ? nullptr : &it->second;
}

bool BookSide::crossed_by(Price limit_price) const {
    if (levels_.empty()) return false;
    // Resting asks are crossed by a buy at or above them, resting bids by a
    // sell at or below them
    return crosses(levels_.begin()->first, limit_price);
}

Quantity BookSide::crossing_quantity(Price limit_price, Quantity cap) const {
    Quantity total = 0;
    for (const auto& [price, level] : levels_) {
        if (total >= cap || !crosses(price, limit_price)) break;
        total += level.total_quantity;
    }
    return total;
}

void BookSide::append(Order* order) {
    auto [it, inserted] = levels_.try_emplace(order->price, order->price);
    it->second.orders.push_back(order);
    it->second.total_quantity += order->remaining_quantity;
}

bool BookSide::remove(Order* order) {
    auto level_it = levels_.find(order->price);
    if (level_it == levels_.end()) return false;

    auto& level = level_it->second;
    auto order_it = std::find(level.orders.begin(), level.orders.end(), order);
    if (order_it == level.orders.end()) return false;

    level.orders.erase(order_it);
    level.total_quantity -= order->remaining_quantity;

    if (level.orders.empty()) {
        levels_.erase(level_it);
    }
    return true;
}

void BookSide::erase_if_empty(Price price) {
    auto it = levels_.find(price);
    if (it != levels_.end() && it->second.orders.empty()) {
        levels_.erase(it);
    }
}

std::vector<DepthLevel> BookSide::depth(size_t levels) const {
    std::vector<DepthLevel> result;
    result.reserve(std::min(levels, levels_.size()));

    for (const auto& [price, level] : levels_) {
        if (result.size() >= levels) break;
        result.push_back({price, level.total_quantity, static_cast<uint32_t>(level.orders.size())});
    }
    return result;
}

/**
 * @brief Construct order book for a specific symbol
 * @param symbol Trading symbol (e.g., "AAPL")
 * @param tick_size Minimum price increment, prices must be multiples of it
 * @param pool_capacity Maximum number of simultaneously resting orders
 */
OrderBook::OrderBook(std::string symbol, Price tick_size, size_t pool_capacity)
    : symbol_(std::move(symbol)), tick_size_(tick_size > 0 ? tick_size : 1), pool_(pool_capacity) {
    order_lookup_.reserve(std::min<size_t>(pool_capacity, 4096));
}

/**
 * @brief Rest an order at the back of its price level
 * @param order Order to copy into the book (remaining_quantity is what rests)
 * @return ORDER_INVALID for non-positive or off-tick prices and non-positive
 *         remaining quantity, ORDER_DUPLICATE for a resting id,
 *         MEMORY_POOL_EXHAUSTED when the pool is full
 */
Result<void> OrderBook::add_resting_order(const Order& order) {
    if (!is_valid_price(order.price) || order.remaining_quantity <= 0) {
        return ErrorCode::ORDER_INVALID;
    }

    if (order_lookup_.contains(order.id)) {
        return ErrorCode::ORDER_DUPLICATE;
    }

    Order* slot = pool_.allocate(order);
    if (!slot) {
        LOG_WARN_SAFE("Order pool exhausted for {} ({} resting)", symbol_, pool_.in_use());
        return ErrorCode::MEMORY_POOL_EXHAUSTED;
    }

    side_of(slot->side).append(slot);
    order_lookup_.emplace(slot->id, slot);
    return Result<void>();
}

/**
 * @brief Remove a resting order
 * @return Copy of the removed order, std::nullopt if it no longer rests
 *
 * Absence is a normal outcome (already filled or cancelled).
 */
std::optional<Order> OrderBook::remove_order(OrderID order_id) {
    auto it = order_lookup_.find(order_id);
    if (it == order_lookup_.end()) {
        return std::nullopt;
    }

    Order* order = it->second;
    side_of(order->side).remove(order);
    order_lookup_.erase(it);

    Order removed = *order;
    pool_.deallocate(order);
    return removed;
}

void OrderBook::fill_front(Side maker_side, Quantity qty) {
    auto& side = side_of(maker_side);
    PriceLevel* level = side.best_level();
    if (!level || level->orders.empty()) return;

    Order* maker = level->orders.front();
    qty = std::min(qty, maker->remaining_quantity);

    maker->remaining_quantity -= qty;
    level->total_quantity -= qty;

    if (maker->remaining_quantity > 0) {
        maker->status = OrderStatus::PARTIALLY_FILLED;
        return;
    }

    level->orders.pop_front();
    order_lookup_.erase(maker->id);
    pool_.deallocate(maker);
    side.erase_if_empty(level->price);
}

Quantity OrderBook::level_quantity(Side side, Price price) const {
    const PriceLevel* level = side_of(side).find_level(price);
    return level ? level->total_quantity : 0;
}

std::optional<Order> OrderBook::find(OrderID order_id) const {
    auto it = order_lookup_.find(order_id);
    if (it == order_lookup_.end()) return std::nullopt;
    return *it->second;
}

bool OrderBook::level_consistent(const BookSide& side, Price price, const PriceLevel& level) const {
    if (level.orders.empty()) {
        LOG_ERROR_SAFE("Empty price level {} persisted on {}", price, symbol_);
        return false;
    }

    Quantity sum = 0;
    for (const Order* order : level.orders) {
        if (order->price != price || order->side != side.side() || order->remaining_quantity <= 0 ||
            !order_lookup_.contains(order->id)) {
            LOG_ERROR_SAFE("Misplaced order {} at level {} on {}", order->id, price, symbol_);
            return false;
        }
        sum += order->remaining_quantity;
    }

    if (sum != level.total_quantity) {
        LOG_ERROR_SAFE("Level total mismatch on {} at {}: cached {} actual {}",
                       symbol_, price, level.total_quantity, sum);
        return false;
    }
    return true;
}

bool OrderBook::uncrossed() const {
    auto bid = best_bid();
    auto ask = best_ask();
    if (bid && ask && *bid >= *ask) {
        LOG_ERROR_SAFE("Crossed book on {}: bid {} >= ask {}", symbol_, *bid, *ask);
        return false;
    }
    return true;
}

/**
 * @brief Verify structural invariants
 * @return INTERNAL_INVARIANT_VIOLATION if any check fails
 *
 * Checks:
 * 1. best_bid < best_ask when both sides are present
 * 2. No empty price level
 * 3. Level total equals the sum of its orders' remaining quantity
 * 4. Every resting order is indexed and sits at its own price on its own side
 *
 * O(resting orders). The matching path uses check_touched() instead.
 */
Result<void> OrderBook::check_invariants() const {
    if (!uncrossed()) {
        return ErrorCode::INTERNAL_INVARIANT_VIOLATION;
    }

    size_t resting = 0;
    for (const BookSide* side : {&bids_, &asks_}) {
        for (const auto& [price, level] : side->levels()) {
            if (!level_consistent(*side, price, level)) {
                return ErrorCode::INTERNAL_INVARIANT_VIOLATION;
            }
            resting += level.orders.size();
        }
    }

    if (resting != order_lookup_.size()) {
        LOG_ERROR_SAFE("Order index size {} does not match {} resting orders on {}",
                       order_lookup_.size(), resting, symbol_);
        return ErrorCode::INTERNAL_INVARIANT_VIOLATION;
    }

    return Result<void>();
}

/**
 * @brief Invariants restricted to what one mutation can have changed
 *
 * Not crossed, both best levels consistent, and the level at (side, price)
 * consistent if it still exists. Cost is bounded by the size of those levels.
 */
Result<void> OrderBook::check_touched(Side side, Price price) const {
    if (!uncrossed()) {
        return ErrorCode::INTERNAL_INVARIANT_VIOLATION;
    }

    for (const BookSide* book_side : {&bids_, &asks_}) {
        if (book_side->empty()) continue;
        const auto& [best, level] = *book_side->levels().begin();
        if (!level_consistent(*book_side, best, level)) {
            return ErrorCode::INTERNAL_INVARIANT_VIOLATION;
        }
    }

    const BookSide& touched = side_of(side);
    if (const PriceLevel* level = touched.find_level(price)) {
        if (!level_consistent(touched, price, *level)) {
            return ErrorCode::INTERNAL_INVARIANT_VIOLATION;
        }
    }

    return Result<void>();
}

} // namespace shardex
