#pragma once

#include "shardex/concurrency_controller.hpp"
#include "shardex/config.hpp"
#include "shardex/error_handling.hpp"
#include "shardex/order_request.hpp"
#include "shardex/position_ledger.hpp"
#include "shardex/risk_manager.hpp"
#include "shardex/snapshot_cache.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace shardex {

// In-process exchange: per-symbol matching engines behind shard locks, a
// position ledger per shard and lock-free snapshot reads. All methods are
// safe to call from any thread.
class Exchange {
public:
    using TradeListener = std::function<void(const Trade&)>;
    using PositionListener = std::function<void(const Position&)>;

    explicit Exchange(std::unique_ptr<Config> config);
    ~Exchange();

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    // Order entry
    Result<OrderID> submit_order(const std::string& symbol, Side side, Price price, Quantity quantity,
                                 ClientID client = DEFAULT_CLIENT);
    Result<SubmitResult> submit(const NewOrder& request);
    Result<void> cancel_order(const std::string& symbol, OrderID order_id);

    // Translated wire requests. A successful cancel reports status CANCELLED.
    Result<SubmitResult> dispatch(const OrderRequest& request);

    // Runs fn with every listed symbol's shard locked; see ConcurrencyController
    Result<void> transact(const std::vector<std::string>& symbols, const ConcurrencyController::TransactionFn& fn);

    // Market data (never takes a shard lock)
    std::optional<std::pair<Price, Price>> best_bid_ask(const std::string& symbol) const;
    DepthView depth(const std::string& symbol, size_t levels) const;
    std::shared_ptr<const BookSnapshot> snapshot(const std::string& symbol) const;

    // Positions (never takes a shard lock). Positions are kept per client:
    // orders entered without a client all belong to DEFAULT_CLIENT, so their
    // fills net out and its position stays flat. Pass the client id used at
    // order entry.
    std::optional<Position> position(const std::string& symbol, ClientID client = DEFAULT_CLIENT) const;
    double unrealized_pnl(const std::string& symbol, double mark_price, ClientID client = DEFAULT_CLIENT) const;
    std::vector<Position> positions() const { return controller_->positions(); }

    // Listeners run on the submitting thread after its shard locks are released
    void add_trade_listener(TradeListener listener);
    void add_position_listener(PositionListener listener);

    EngineStats stats() const { return controller_->stats(); }
    const Config& config() const { return *config_; }
    const RiskManager& risk_manager() const { return *risk_manager_; }
    ConcurrencyController& controller() { return *controller_; }

private:
    std::unique_ptr<Config> config_;

    // Core components, in construction order
    std::unique_ptr<RiskManager> risk_manager_;
    std::unique_ptr<SnapshotCache> snapshots_;
    std::unique_ptr<ConcurrencyController> controller_;

    mutable std::shared_mutex listeners_mutex_;
    std::vector<TradeListener> trade_listeners_;
    std::vector<PositionListener> position_listeners_;

    void initialize_risk_manager();
    void initialize_snapshots();
    void initialize_controller();

    void notify(const TransactionEvents& events) const;
};

} // namespace shardex
