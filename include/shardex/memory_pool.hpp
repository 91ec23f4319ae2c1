#pragma once

#include "shardex/types.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace shardex {

// Fixed-capacity object pool with an index free list.
// Not thread-safe: each pool is owned by one order book and only touched
// while that book's shard write lock is held.
template<typename T>
class MemoryPool {
public:
    explicit MemoryPool(size_t capacity)
        : capacity_(capacity), pool_(capacity), free_list_(capacity) {
        for (size_t i = 0; i < capacity; ++i) {
            free_list_[i] = capacity - 1 - i;
        }
        free_count_ = capacity;
    }

    MemoryPool(const MemoryPool&) = delete;
    MemoryPool& operator=(const MemoryPool&) = delete;

    // O(1) allocation, nullptr when exhausted
    template<typename... Args>
    T* allocate(Args&&... args) {
        if (free_count_ == 0) return nullptr;
        T* slot = &pool_[free_list_[--free_count_]];
        *slot = T(std::forward<Args>(args)...);
        return slot;
    }

    // O(1) deallocation; foreign pointers are ignored
    void deallocate(T* ptr) {
        if (!owns(ptr) || free_count_ == capacity_) return;
        *ptr = T();
        free_list_[free_count_++] = static_cast<size_t>(ptr - pool_.data());
    }

    bool owns(const T* ptr) const {
        return ptr && ptr >= pool_.data() && ptr < pool_.data() + capacity_;
    }

    size_t available() const { return free_count_; }
    size_t in_use() const { return capacity_ - free_count_; }
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::vector<T> pool_;
    std::vector<size_t> free_list_;
    size_t free_count_{0};
};

using OrderPool = MemoryPool<Order>;

} // namespace shardex
