/**
 * @file concurrency_controller.cpp
 * @brief Symbol sharding and ordered multi-shard locking
 *
 * Every symbol maps to one shard by hash. A shard owns the matching engines
 * of its symbols and one position ledger, all guarded by a single write
 * lock. The only way to take shard locks is transact(), which sorts the
 * shard indices first, so no two transactions can wait on each other in a
 * cycle.
 */

#include "shardex/concurrency_controller.hpp"
#include "shardex/logger.hpp"
#include <algorithm>
#include <iterator>

namespace shardex {

ConcurrencyController::ConcurrencyController(const Config& config, SnapshotCache& snapshots, RiskManager* risk)
    : snapshots_(snapshots), risk_(risk), lock_timeout_(config.engine.lock_timeout_ms) {
    size_t shard_count = std::max<size_t>(config.engine.shard_count, 1);
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }

    for (const auto& symbol_config : config.symbols) {
        size_t index = std::hash<std::string>{}(symbol_config.symbol) % shard_count;
        Shard* shard = shards_[index].get();

        // Ledger update runs inside the submit that produced the trade
        auto on_trade = [shard](const Trade& trade) {
            shard->ledger.apply_trade(trade, &shard->pending_positions);
            shard->pending_trades.push_back(trade);
        };

        shard->engines.emplace(symbol_config.symbol,
                               std::make_unique<MatchingEngine>(symbol_config, config.engine.order_pool_size, on_trade));
        symbol_shards_[symbol_config.symbol] = index;
        symbols_.push_back(symbol_config.symbol);

        LOG_DEBUG_SAFE("Symbol {} assigned to shard {}", symbol_config.symbol, index);
    }

    LOG_INFO_SAFE("Concurrency controller: {} shards, {} symbols, lock timeout {} ms",
                  shards_.size(), symbols_.size(), lock_timeout_.count());
}

size_t ConcurrencyController::shard_for(const std::string& symbol) const {
    auto it = symbol_shards_.find(symbol);
    if (it != symbol_shards_.end()) {
        return it->second;
    }
    return std::hash<std::string>{}(symbol) % shards_.size();
}

Result<void> ConcurrencyController::transact(const std::vector<std::string>& symbols, const TransactionFn& fn,
                                             TransactionEvents* events) {
    std::vector<std::string> scope;
    std::vector<size_t> indices;
    scope.reserve(symbols.size());
    indices.reserve(symbols.size());

    for (const auto& symbol : symbols) {
        auto it = symbol_shards_.find(symbol);
        if (it == symbol_shards_.end()) {
            LOG_DEBUG_SAFE("Transaction refused: unknown symbol {}", symbol);
            return ErrorCode::ORDER_INVALID;
        }
        scope.push_back(symbol);
        indices.push_back(it->second);
    }

    std::sort(scope.begin(), scope.end());
    scope.erase(std::unique(scope.begin(), scope.end()), scope.end());

    // Global lock order: ascending shard index
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    std::vector<std::unique_lock<std::timed_mutex>> locks;
    locks.reserve(indices.size());
    for (size_t index : indices) {
        std::unique_lock<std::timed_mutex> lock(shards_[index]->mutex, std::defer_lock);
        if (lock_timeout_.count() > 0) {
            if (!lock.try_lock_for(lock_timeout_)) {
                LOG_WARN_SAFE("Shard {} busy after {} ms", index, lock_timeout_.count());
                return ErrorCode::SHARD_BUSY;
            }
        } else {
            lock.lock();
        }
        locks.push_back(std::move(lock));
    }

    ShardTransaction transaction(*this, std::move(scope));
    fn(transaction);

    // Release in reverse acquisition order
    while (!locks.empty()) {
        locks.pop_back();
    }

    if (events) {
        *events = std::move(transaction.events_);
    }
    return Result<void>();
}

const PositionLedger* ConcurrencyController::ledger_for(const std::string& symbol) const {
    if (!is_known_symbol(symbol)) {
        return nullptr;
    }
    return &shard_of(symbol).ledger;
}

EngineStats ConcurrencyController::stats() const {
    EngineStats total;
    for (const auto& shard : shards_) {
        for (const auto& [symbol, engine] : shard->engines) {
            total += engine->stats();
        }
    }
    return total;
}

std::vector<Position> ConcurrencyController::positions() const {
    std::vector<Position> all;
    for (const auto& shard : shards_) {
        auto shard_positions = shard->ledger.positions();
        all.insert(all.end(), std::make_move_iterator(shard_positions.begin()),
                   std::make_move_iterator(shard_positions.end()));
    }
    return all;
}

bool ShardTransaction::covers(const std::string& symbol) const {
    return std::binary_search(symbols_.begin(), symbols_.end(), symbol);
}

const OrderBook* ShardTransaction::book(const std::string& symbol) const {
    if (!covers(symbol)) return nullptr;
    return &controller_.shard_of(symbol).engines.at(symbol)->book();
}

const PositionLedger* ShardTransaction::ledger(const std::string& symbol) const {
    if (!covers(symbol)) return nullptr;
    return &controller_.shard_of(symbol).ledger;
}

/**
 * @brief Full in-shard path of one new order
 *
 * Order validation, risk check against the shard's ledger, then match. The
 * engine's trade callback has already updated the ledger by the time submit
 * returns; the resulting positions and trades are queued for delivery after
 * unlock and the symbol's snapshot is republished.
 */
Result<SubmitResult> ShardTransaction::submit(const NewOrder& request) {
    if (!covers(request.symbol)) {
        LOG_ERROR_SAFE("Submit on {} outside the transaction's symbols", request.symbol);
        return ErrorCode::ORDER_INVALID;
    }

    auto& shard = controller_.shard_of(request.symbol);
    MatchingEngine& engine = *shard.engines.at(request.symbol);

    // Malformed orders are ORDER_INVALID whatever the risk limits say
    auto valid = engine.validate(request);
    if (valid.has_error()) {
        return valid.error();
    }

    if (controller_.risk_) {
        auto approved = controller_.risk_->validate_new_order(request, shard.ledger);
        if (approved.has_error()) {
            return approved.error();
        }
    }

    auto result = engine.submit(request);

    // Collected by the trade callback, so trades that precede a failed
    // invariant check are delivered along with their positions
    std::move(shard.pending_trades.begin(), shard.pending_trades.end(),
              std::back_inserter(events_.trades));
    shard.pending_trades.clear();
    std::move(shard.pending_positions.begin(), shard.pending_positions.end(),
              std::back_inserter(events_.positions));
    shard.pending_positions.clear();

    // A failed invariant check still follows a mutation, so readers must see it
    if (result.has_value() || result.is(ErrorCode::INTERNAL_INVARIANT_VIOLATION)) {
        controller_.snapshots_.publish(engine.book());
    }

    return result;
}

Result<void> ShardTransaction::cancel(const std::string& symbol, OrderID order_id) {
    if (!covers(symbol)) {
        LOG_ERROR_SAFE("Cancel on {} outside the transaction's symbols", symbol);
        return ErrorCode::ORDER_INVALID;
    }

    MatchingEngine& engine = *controller_.shard_of(symbol).engines.at(symbol);
    auto result = engine.cancel(order_id);

    if (result.has_value() || result.is(ErrorCode::INTERNAL_INVARIANT_VIOLATION)) {
        controller_.snapshots_.publish(engine.book());
    }
    return result;
}

} // namespace shardex
