#pragma once

#include "shardex/config.hpp"
#include "shardex/error_handling.hpp"
#include "shardex/order_book.hpp"
#include "shardex/order_request.hpp"
#include "shardex/thread_safety.hpp"
#include "shardex/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace shardex {

struct SubmitResult {
    OrderID order_id{0};
    OrderStatus status{OrderStatus::NEW};
    Quantity filled_quantity{0};
    Quantity remaining_quantity{0};
    std::vector<Trade> trades;
};

struct EngineStats {
    uint64_t orders_processed{0};
    uint64_t orders_rejected{0};
    uint64_t orders_cancelled{0};
    uint64_t trades_executed{0};
    uint64_t volume_traded{0};

    EngineStats& operator+=(const EngineStats& other);
};

// Price-time priority matcher for one symbol. The engine is the only writer
// of its order book; callers serialize access through the symbol's shard.
class MatchingEngine {
public:
    using TradeCallback = std::function<void(const Trade&)>;

    MatchingEngine(const SymbolConfig& symbol, size_t pool_capacity, TradeCallback cb = nullptr);

    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    Result<SubmitResult> submit(const NewOrder& request);
    Result<void> cancel(OrderID order_id);

    // Symbol, positive tick-aligned price, positive lot-aligned quantity.
    // Failures count as rejections.
    Result<void> validate(const NewOrder& request);

    const std::string& symbol() const { return symbol_; }
    const SymbolConfig& symbol_config() const { return config_; }
    const OrderBook& book() const { return book_; }

    EngineStats stats() const;
    uint64_t orders_processed() const { return orders_processed_.get(); }
    uint64_t trades_executed() const { return trades_executed_.get(); }

private:
    SymbolConfig config_;
    std::string symbol_;
    OrderBook book_;
    TradeCallback trade_callback_;

    OrderID next_order_id_{1};
    TradeID next_trade_id_{1};

    StatCounter orders_processed_;
    StatCounter orders_rejected_;
    StatCounter orders_cancelled_;
    StatCounter trades_executed_;
    StatCounter volume_traded_;

    Result<void> check_order(const NewOrder& request) const;
    void match(Order& taker, std::vector<Trade>& trades);
};

} // namespace shardex
