#pragma once

#include <atomic>
#include <cstdint>

namespace shardex {

// Thread safety annotations (checked by clang -Wthread-safety, no-ops elsewhere)
#if defined(__clang__)
#define THREAD_ANNOTATION(x) __attribute__((x))
#else
#define THREAD_ANNOTATION(x)
#endif

#define GUARDED_BY(x) THREAD_ANNOTATION(guarded_by(x))
#define PT_GUARDED_BY(x) THREAD_ANNOTATION(pt_guarded_by(x))
#define REQUIRES(x) THREAD_ANNOTATION(requires_capability(x))
#define EXCLUDES(x) THREAD_ANNOTATION(locks_excluded(x))

// Relaxed monotonic counter for statistics read from other threads
class StatCounter {
public:
    void add(uint64_t value = 1) { value_.fetch_add(value, std::memory_order_relaxed); }
    uint64_t get() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

} // namespace shardex
