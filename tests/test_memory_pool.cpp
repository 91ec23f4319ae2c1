#include <gtest/gtest.h>
#include "shardex/memory_pool.hpp"
#include <vector>

namespace shardex {

class MemoryPoolTest : public ::testing::Test {
protected:
    OrderPool pool{4};
};

TEST_F(MemoryPoolTest, AllocateConstructsInPlace) {
    Order* order = pool.allocate(7, "AAPL", 3, Side::SELL, 101, 25);
    ASSERT_NE(order, nullptr);
    EXPECT_EQ(order->id, 7u);
    EXPECT_EQ(order->symbol, "AAPL");
    EXPECT_EQ(order->client_id, 3u);
    EXPECT_EQ(order->side, Side::SELL);
    EXPECT_EQ(order->remaining_quantity, 25);
    EXPECT_TRUE(pool.owns(order));
    EXPECT_EQ(pool.in_use(), 1u);
    EXPECT_EQ(pool.available(), 3u);
}

TEST_F(MemoryPoolTest, ExhaustionReturnsNull) {
    std::vector<Order*> held;
    for (size_t i = 0; i < pool.capacity(); ++i) {
        held.push_back(pool.allocate(i + 1, "AAPL", 1, Side::BUY, 100, 1));
        ASSERT_NE(held.back(), nullptr);
    }
    EXPECT_EQ(pool.available(), 0u);
    EXPECT_EQ(pool.allocate(99, "AAPL", 1, Side::BUY, 100, 1), nullptr);

    pool.deallocate(held.back());
    EXPECT_EQ(pool.available(), 1u);
    EXPECT_NE(pool.allocate(100, "AAPL", 1, Side::BUY, 100, 1), nullptr);
}

TEST_F(MemoryPoolTest, DeallocatedSlotIsReused) {
    Order* first = pool.allocate(1, "AAPL", 1, Side::BUY, 100, 1);
    pool.deallocate(first);
    EXPECT_EQ(first->id, 0u);

    Order* second = pool.allocate(2, "MSFT", 1, Side::BUY, 100, 1);
    EXPECT_EQ(second, first);
    EXPECT_EQ(second->symbol, "MSFT");
}

TEST_F(MemoryPoolTest, ForeignPointersIgnored) {
    Order outside;
    EXPECT_FALSE(pool.owns(&outside));
    EXPECT_FALSE(pool.owns(nullptr));

    pool.deallocate(&outside);
    pool.deallocate(nullptr);
    EXPECT_EQ(pool.available(), pool.capacity());
}

} // namespace shardex
