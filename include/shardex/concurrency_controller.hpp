#pragma once

#include "shardex/config.hpp"
#include "shardex/error_handling.hpp"
#include "shardex/matching_engine.hpp"
#include "shardex/order_request.hpp"
#include "shardex/position_ledger.hpp"
#include "shardex/risk_manager.hpp"
#include "shardex/snapshot_cache.hpp"
#include "shardex/thread_safety.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace shardex {

// Events produced inside a critical section, delivered after the locks drop
struct TransactionEvents {
    std::vector<Trade> trades;
    std::vector<Position> positions;

    bool empty() const { return trades.empty() && positions.empty(); }
};

class ConcurrencyController;

// Write access to the symbols a transaction was opened for. Every other
// symbol is refused, so a transaction can never touch a shard it did not lock.
class ShardTransaction {
public:
    ShardTransaction(const ShardTransaction&) = delete;
    ShardTransaction& operator=(const ShardTransaction&) = delete;

    // Validation, risk check, match, ledger update and snapshot publish for one order
    Result<SubmitResult> submit(const NewOrder& request);
    Result<void> cancel(const std::string& symbol, OrderID order_id);

    bool covers(const std::string& symbol) const;
    const OrderBook* book(const std::string& symbol) const;
    const PositionLedger* ledger(const std::string& symbol) const;

    const std::vector<std::string>& symbols() const { return symbols_; }
    const TransactionEvents& events() const { return events_; }

private:
    friend class ConcurrencyController;

    ShardTransaction(ConcurrencyController& controller, std::vector<std::string> symbols)
        : controller_(controller), symbols_(std::move(symbols)) {}

    ConcurrencyController& controller_;
    std::vector<std::string> symbols_;
    TransactionEvents events_;
};

// Owns the shards. A symbol belongs to exactly one shard; each shard has a
// single write lock guarding its engines and ledger. Locks are only taken
// through transact(), which acquires them in ascending shard index order.
class ConcurrencyController {
public:
    using TransactionFn = std::function<void(ShardTransaction&)>;

    ConcurrencyController(const Config& config, SnapshotCache& snapshots, RiskManager* risk = nullptr);

    ConcurrencyController(const ConcurrencyController&) = delete;
    ConcurrencyController& operator=(const ConcurrencyController&) = delete;

    size_t shard_count() const { return shards_.size(); }
    size_t shard_for(const std::string& symbol) const;
    bool is_known_symbol(const std::string& symbol) const { return symbol_shards_.contains(symbol); }
    const std::vector<std::string>& symbols() const { return symbols_; }

    // Locks every shard the symbols map to, runs fn, unlocks. Fails with
    // ORDER_INVALID for unknown symbols and SHARD_BUSY when a lock timeout is
    // configured and expires; fn has not run in either case.
    Result<void> transact(const std::vector<std::string>& symbols, const TransactionFn& fn,
                          TransactionEvents* events = nullptr);

    Result<void> with_symbol(const std::string& symbol, const TransactionFn& fn,
                             TransactionEvents* events = nullptr) {
        return transact({symbol}, fn, events);
    }

    // Lock-free read paths
    const PositionLedger* ledger_for(const std::string& symbol) const;
    EngineStats stats() const;
    std::vector<Position> positions() const;

private:
    friend class ShardTransaction;

    struct Shard {
        std::timed_mutex mutex;
        std::unordered_map<std::string, std::unique_ptr<MatchingEngine>> engines;  // Fixed after construction
        PositionLedger ledger;
        std::vector<Trade> pending_trades GUARDED_BY(mutex);
        std::vector<Position> pending_positions GUARDED_BY(mutex);
    };

    std::vector<std::unique_ptr<Shard>> shards_;
    std::unordered_map<std::string, size_t> symbol_shards_;
    std::vector<std::string> symbols_;
    SnapshotCache& snapshots_;
    RiskManager* risk_;
    std::chrono::milliseconds lock_timeout_;

    Shard& shard_of(const std::string& symbol) { return *shards_[symbol_shards_.at(symbol)]; }
    const Shard& shard_of(const std::string& symbol) const { return *shards_[symbol_shards_.at(symbol)]; }
};

} // namespace shardex
