#include "shardex/snapshot_cache.hpp"
#include "shardex/logger.hpp"
#include <algorithm>
#include <chrono>

namespace shardex {

DepthView::DepthView(std::shared_ptr<const BookSnapshot> snapshot, size_t levels)
    : snapshot_(std::move(snapshot)) {
    if (snapshot_) {
        bids_ = std::span<const DepthLevel>(snapshot_->bids).first(std::min(levels, snapshot_->bids.size()));
        asks_ = std::span<const DepthLevel>(snapshot_->asks).first(std::min(levels, snapshot_->asks.size()));
    }
}

SnapshotCache::SnapshotCache(const std::vector<std::string>& symbols, size_t depth)
    : depth_(depth) {
    for (const auto& symbol : symbols) {
        auto entry = std::make_unique<Entry>();

        auto empty = std::make_shared<BookSnapshot>();
        empty->symbol = symbol;
        empty->timestamp = std::chrono::steady_clock::now();
        entry->current.store(std::move(empty), std::memory_order_release);

        entries_.emplace(symbol, std::move(entry));
    }
    LOG_DEBUG_SAFE("Snapshot cache ready for {} symbols, depth {}", entries_.size(), depth_);
}

std::shared_ptr<const BookSnapshot> SnapshotCache::publish(const OrderBook& book) {
    auto it = entries_.find(book.symbol());
    if (it == entries_.end()) {
        LOG_ERROR_SAFE("Snapshot publish for unregistered symbol {}", book.symbol());
        return nullptr;
    }
    Entry& entry = *it->second;

    // Single writer per symbol, so reading the previous version is race free
    auto previous = entry.current.load(std::memory_order_acquire);

    auto next = std::make_shared<BookSnapshot>();
    next->symbol = book.symbol();
    next->best_bid = book.best_bid();
    next->best_ask = book.best_ask();
    next->bids = book.depth(Side::BUY, depth_);
    next->asks = book.depth(Side::SELL, depth_);
    next->version = previous ? previous->version + 1 : 1;
    next->timestamp = std::chrono::steady_clock::now();

    std::shared_ptr<const BookSnapshot> published = std::move(next);
    entry.current.store(published, std::memory_order_release);
    publishes_.fetch_add(1, std::memory_order_relaxed);
    return published;
}

std::shared_ptr<const BookSnapshot> SnapshotCache::latest(const std::string& symbol) const {
    auto it = entries_.find(symbol);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second->current.load(std::memory_order_acquire);
}

} // namespace shardex
