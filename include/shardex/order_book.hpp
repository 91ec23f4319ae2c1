#pragma once

#include "shardex/types.hpp"
#include "shardex/memory_pool.hpp"
#include "shardex/error_handling.hpp"
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shardex {

struct PriceLevel {
    Price price;
    std::deque<Order*> orders;  // FIFO queue for price-time priority
    Quantity total_quantity{0};

    explicit PriceLevel(Price p) : price(p) {}

    bool empty() const { return orders.empty(); }
};

// One side of a book. Bids iterate descending, asks ascending, so the best
// price is always begin().
class BookSide {
public:
    struct PriceOrder {
        Side side;
        bool operator()(Price a, Price b) const {
            return side == Side::BUY ? a > b : a < b;
        }
    };
    using Levels = std::map<Price, PriceLevel, PriceOrder>;

    explicit BookSide(Side side) : side_(side), levels_(PriceOrder{side}) {}

    Side side() const { return side_; }
    bool empty() const { return levels_.empty(); }
    size_t level_count() const { return levels_.size(); }

    std::optional<Price> best_price() const;
    PriceLevel* best_level();
    const PriceLevel* find_level(Price price) const;

    // True if an incoming order on the other side at limit_price would trade
    // against this side's best level
    bool crossed_by(Price limit_price) const;

    // Resting quantity an incoming order at limit_price could trade against,
    // summed from cached level totals. Stops once cap is reached.
    Quantity crossing_quantity(Price limit_price, Quantity cap) const;

    void append(Order* order);
    bool remove(Order* order);
    void erase_if_empty(Price price);

    std::vector<DepthLevel> depth(size_t levels) const;
    const Levels& levels() const { return levels_; }

private:
    Side side_;
    Levels levels_;

    bool crosses(Price level_price, Price limit_price) const {
        return side_ == Side::SELL ? limit_price >= level_price : limit_price <= level_price;
    }
};

// Resting order state for one symbol. Not internally synchronized: every
// call must happen under the owning shard's write lock.
class OrderBook {
public:
    OrderBook(std::string symbol, Price tick_size, size_t pool_capacity);

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;

    const std::string& symbol() const { return symbol_; }
    Price tick_size() const { return tick_size_; }

    Result<void> add_resting_order(const Order& order);
    std::optional<Order> remove_order(OrderID order_id);

    // Consume qty from the front order of the best level on maker_side.
    // A maker that reaches zero is evicted and its level pruned, so any
    // pointer into that level is invalid afterwards.
    void fill_front(Side maker_side, Quantity qty);

    std::optional<Price> best_price(Side side) const { return side_of(side).best_price(); }
    std::optional<Price> best_bid() const { return bids_.best_price(); }
    std::optional<Price> best_ask() const { return asks_.best_price(); }

    std::vector<DepthLevel> depth(Side side, size_t levels) const { return side_of(side).depth(levels); }
    Quantity level_quantity(Side side, Price price) const;

    std::optional<Order> find(OrderID order_id) const;
    bool contains(OrderID order_id) const { return order_lookup_.contains(order_id); }
    size_t order_count() const { return order_lookup_.size(); }
    bool has_capacity() const { return pool_.available() > 0; }

    BookSide& side_of(Side side) { return side == Side::BUY ? bids_ : asks_; }
    const BookSide& side_of(Side side) const { return side == Side::BUY ? bids_ : asks_; }

    bool is_valid_price(Price price) const { return price > 0 && price % tick_size_ == 0; }

    // Never-crossed, no empty level, level totals and lookup consistency
    Result<void> check_invariants() const;

    // Same checks limited to both best levels and the level at (side, price)
    Result<void> check_touched(Side side, Price price) const;

private:
    std::string symbol_;
    Price tick_size_;
    OrderPool pool_;

    // Price levels: bids descending, asks ascending
    BookSide bids_{Side::BUY};
    BookSide asks_{Side::SELL};

    // Id to order; the cancel itself still scans the order's price level
    std::unordered_map<OrderID, Order*> order_lookup_;

    bool uncrossed() const;
    bool level_consistent(const BookSide& side, Price price, const PriceLevel& level) const;
};

} // namespace shardex
