#pragma once

#include "shardex/types.hpp"
#include "shardex/thread_safety.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace shardex {

struct Position {
    ClientID client_id{DEFAULT_CLIENT};
    std::string symbol;
    Quantity quantity{0};      // +long / -short
    double avg_price{0.0};     // Meaningless (kept at 0) while flat
    double realized_pnl{0.0};

    bool is_flat() const { return quantity == 0; }

    // Apply one fill and return the PnL it realized.
    // Same-direction fills move avg_price by weighted average cost; opposite
    // fills realize (price - avg_price) on the closed quantity, and any part
    // that carries through zero opens a new position at the fill price.
    double apply_fill(Side side, Quantity qty, Price price);

    double unrealized_pnl(double mark_price) const {
        return quantity == 0 ? 0.0 : (mark_price - avg_price) * static_cast<double>(quantity);
    }
};

// Positions per (client, symbol). Writes come from one shard's matching path;
// reads take a shared lock and never touch the shard write lock.
class PositionLedger {
public:
    PositionLedger() = default;

    PositionLedger(const PositionLedger&) = delete;
    PositionLedger& operator=(const PositionLedger&) = delete;

    // Updates both counterparties. When updated is non-null the resulting
    // taker and maker positions are appended to it, in that order.
    void apply_trade(const Trade& trade, std::vector<Position>* updated = nullptr);

    std::optional<Position> position(ClientID client, const std::string& symbol) const;
    Quantity net_quantity(ClientID client, const std::string& symbol) const;
    double unrealized_pnl(ClientID client, const std::string& symbol, double mark_price) const;

    std::vector<Position> positions() const;
    std::vector<Position> positions_for(const std::string& symbol) const;

    uint64_t trades_applied() const { return trades_applied_.get(); }

private:
    struct Key {
        ClientID client;
        std::string symbol;
        bool operator==(const Key&) const = default;
    };

    struct KeyHash {
        size_t operator()(const Key& key) const {
            return std::hash<std::string>{}(key.symbol) * 31 + key.client;
        }
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, Position, KeyHash> positions_ GUARDED_BY(mutex_);
    StatCounter trades_applied_;

    Position& position_for(ClientID client, const std::string& symbol) REQUIRES(mutex_);
};

} // namespace shardex
