#pragma once

#include "shardex/order_book.hpp"
#include "shardex/types.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace shardex {

// Immutable top-of-book and depth picture of one symbol. Never modified once
// published; readers share it through shared_ptr.
struct BookSnapshot {
    std::string symbol;
    std::optional<Price> best_bid;
    std::optional<Price> best_ask;
    std::vector<DepthLevel> bids;  // Best first
    std::vector<DepthLevel> asks;  // Best first
    uint64_t version{0};
    Timestamp timestamp{};

    bool crossed() const { return best_bid && best_ask && *best_bid >= *best_ask; }
};

// Borrowed view over the first levels of a published snapshot. Holding the
// view keeps the snapshot alive; no book state is copied.
class DepthView {
public:
    DepthView() = default;
    DepthView(std::shared_ptr<const BookSnapshot> snapshot, size_t levels);

    std::span<const DepthLevel> bids() const { return bids_; }
    std::span<const DepthLevel> asks() const { return asks_; }

    uint64_t version() const { return snapshot_ ? snapshot_->version : 0; }
    bool valid() const { return snapshot_ != nullptr; }
    const BookSnapshot* snapshot() const { return snapshot_.get(); }

private:
    std::shared_ptr<const BookSnapshot> snapshot_;
    std::span<const DepthLevel> bids_;
    std::span<const DepthLevel> asks_;
};

// Latest published snapshot per symbol. The symbol set is fixed at
// construction, so the lookup map itself is never mutated afterwards and
// readers need no lock. Each symbol has exactly one writer: its shard.
class SnapshotCache {
public:
    SnapshotCache(const std::vector<std::string>& symbols, size_t depth);

    SnapshotCache(const SnapshotCache&) = delete;
    SnapshotCache& operator=(const SnapshotCache&) = delete;

    // Captures the book and swaps it in as the next version. Caller must hold
    // the write lock of the book's shard.
    std::shared_ptr<const BookSnapshot> publish(const OrderBook& book);

    // Nullptr only for symbols the cache was not built with
    std::shared_ptr<const BookSnapshot> latest(const std::string& symbol) const;

    bool contains(const std::string& symbol) const { return entries_.contains(symbol); }
    size_t depth() const { return depth_; }
    uint64_t publishes() const { return publishes_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        std::atomic<std::shared_ptr<const BookSnapshot>> current;
    };

    size_t depth_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
    std::atomic<uint64_t> publishes_{0};
};

} // namespace shardex
