/**
 * @file exchange.cpp
 * @brief Exchange facade - wires risk, shards, ledgers and snapshots together
 *
 * The Exchange:
 * - Owns the configuration and validates it before building anything
 * - Creates one risk manager shared by all shards
 * - Creates the snapshot cache with one entry per configured symbol
 * - Creates the concurrency controller, which builds the shards and their
 *   per-symbol matching engines
 * - Delivers trade and position events to listeners outside the locks
 */

#include "shardex/exchange.hpp"
#include "shardex/logger.hpp"
#include <stdexcept>
#include <variant>

namespace shardex {

/**
 * @brief Exchange constructor - initializes all components
 * @param config Configuration object (ownership transferred)
 * @throws std::runtime_error if the configuration is missing or invalid
 *
 * Initialization order:
 * 1. Risk manager (needs symbol limits)
 * 2. Snapshot cache (needs the symbol set)
 * 3. Concurrency controller (needs both)
 */
Exchange::Exchange(std::unique_ptr<Config> config)
    : config_(std::move(config)) {
    if (!config_) {
        throw std::runtime_error("Exchange requires a configuration");
    }
    auto valid = config_->validate();
    if (valid.has_error()) {
        throw std::runtime_error("Invalid exchange configuration: " + valid.error().message());
    }

    initialize_risk_manager();
    initialize_snapshots();
    initialize_controller();

    LOG_INFO_SAFE("Exchange {} ready with {} symbols", config_->engine.name, config_->symbols.size());
}

Exchange::~Exchange() {
    LOG_INFO_SAFE("Exchange {} shutting down", config_->engine.name);
}

void Exchange::initialize_risk_manager() {
    risk_manager_ = std::make_unique<RiskManager>(config_->risk, config_->symbols);
    LOG_INFO("Initialized risk manager");
}

void Exchange::initialize_snapshots() {
    std::vector<std::string> symbols;
    symbols.reserve(config_->symbols.size());
    for (const auto& symbol : config_->symbols) {
        symbols.push_back(symbol.symbol);
    }
    snapshots_ = std::make_unique<SnapshotCache>(symbols, config_->engine.snapshot_depth);
    LOG_INFO_SAFE("Initialized snapshot cache with depth {}", config_->engine.snapshot_depth);
}

void Exchange::initialize_controller() {
    controller_ = std::make_unique<ConcurrencyController>(*config_, *snapshots_, risk_manager_.get());
}

Result<OrderID> Exchange::submit_order(const std::string& symbol, Side side, Price price, Quantity quantity,
                                       ClientID client) {
    return submit(NewOrder{symbol, side, price, quantity, client})
        .map([](const SubmitResult& result) { return result.order_id; });
}

/**
 * @brief Submit a new order and return the full outcome
 *
 * Control flow: shard lock -> risk -> match -> ledger -> snapshot -> unlock
 * -> listeners. Rejections leave book, ledger and snapshot untouched.
 */
Result<SubmitResult> Exchange::submit(const NewOrder& request) {
    std::optional<Result<SubmitResult>> outcome;
    TransactionEvents events;

    auto locked = controller_->with_symbol(request.symbol, [&](ShardTransaction& transaction) {
        outcome.emplace(transaction.submit(request));
    }, &events);

    if (locked.has_error()) {
        return locked.error();
    }

    notify(events);

    if (outcome->has_value()) {
        const auto& result = outcome->value();
        LOG_DEBUG_SAFE("Order {} on {}: {} filled {} remaining {} in {} trades", result.order_id,
                       request.symbol, to_string(result.status), result.filled_quantity,
                       result.remaining_quantity, result.trades.size());
    }
    return std::move(*outcome);
}

/**
 * @brief Cancel a resting order
 * @return ORDER_NOT_FOUND when the order already filled or was cancelled
 */
Result<void> Exchange::cancel_order(const std::string& symbol, OrderID order_id) {
    std::optional<Result<void>> outcome;

    auto locked = controller_->with_symbol(symbol, [&](ShardTransaction& transaction) {
        outcome.emplace(transaction.cancel(symbol, order_id));
    });

    if (locked.has_error()) {
        return locked.error();
    }
    return *outcome;
}

Result<SubmitResult> Exchange::dispatch(const OrderRequest& request) {
    if (const auto* order = std::get_if<NewOrder>(&request)) {
        return submit(*order);
    }

    const auto& cancel = std::get<CancelOrder>(request);
    auto cancelled = cancel_order(cancel.symbol, cancel.order_id);
    if (cancelled.has_error()) {
        return cancelled.error();
    }

    SubmitResult result;
    result.order_id = cancel.order_id;
    result.status = OrderStatus::CANCELLED;
    return result;
}

Result<void> Exchange::transact(const std::vector<std::string>& symbols,
                                const ConcurrencyController::TransactionFn& fn) {
    TransactionEvents events;
    auto locked = controller_->transact(symbols, fn, &events);
    if (locked.has_value()) {
        notify(events);
    }
    return locked;
}

std::optional<std::pair<Price, Price>> Exchange::best_bid_ask(const std::string& symbol) const {
    auto current = snapshots_->latest(symbol);
    if (!current || !current->best_bid || !current->best_ask) {
        return std::nullopt;
    }
    return std::make_pair(*current->best_bid, *current->best_ask);
}

DepthView Exchange::depth(const std::string& symbol, size_t levels) const {
    return DepthView(snapshots_->latest(symbol), levels);
}

std::shared_ptr<const BookSnapshot> Exchange::snapshot(const std::string& symbol) const {
    return snapshots_->latest(symbol);
}

std::optional<Position> Exchange::position(const std::string& symbol, ClientID client) const {
    const PositionLedger* ledger = controller_->ledger_for(symbol);
    if (!ledger) {
        return std::nullopt;
    }
    return ledger->position(client, symbol);
}

double Exchange::unrealized_pnl(const std::string& symbol, double mark_price, ClientID client) const {
    const PositionLedger* ledger = controller_->ledger_for(symbol);
    if (!ledger) {
        return 0.0;
    }
    return ledger->unrealized_pnl(client, symbol, mark_price);
}

void Exchange::add_trade_listener(TradeListener listener) {
    std::unique_lock lock(listeners_mutex_);
    trade_listeners_.push_back(std::move(listener));
}

void Exchange::add_position_listener(PositionListener listener) {
    std::unique_lock lock(listeners_mutex_);
    position_listeners_.push_back(std::move(listener));
}

void Exchange::notify(const TransactionEvents& events) const {
    if (events.empty()) return;

    std::shared_lock lock(listeners_mutex_);
    for (const auto& trade : events.trades) {
        for (const auto& listener : trade_listeners_) {
            listener(trade);
        }
    }
    for (const auto& position : events.positions) {
        for (const auto& listener : position_listeners_) {
            listener(position);
        }
    }
}

} // namespace shardex
