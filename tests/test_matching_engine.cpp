#include <gtest/gtest.h>
#include "shardex/matching_engine.hpp"
#include <random>

namespace shardex {

class MatchingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_unique<MatchingEngine>(SymbolConfig{"AAPL", 1, 1, 0}, 100,
            [this](const Trade& trade) { trades.push_back(trade); });
    }

    Result<SubmitResult> submit(Side side, Price price, Quantity qty, ClientID client = 1) {
        return engine->submit(NewOrder{"AAPL", side, price, qty, client});
    }

    std::unique_ptr<MatchingEngine> engine;
    std::vector<Trade> trades;
};

TEST_F(MatchingEngineTest, PartialFillOfRestingBid) {
    auto buy = submit(Side::BUY, 100, 10, 1);
    ASSERT_TRUE(buy);
    EXPECT_EQ(buy.value().status, OrderStatus::NEW);
    EXPECT_TRUE(buy.value().trades.empty());

    auto sell = submit(Side::SELL, 100, 4, 2);
    ASSERT_TRUE(sell);
    EXPECT_EQ(sell.value().status, OrderStatus::FILLED);
    EXPECT_EQ(sell.value().remaining_quantity, 0);
    ASSERT_EQ(sell.value().trades.size(), 1u);

    const Trade& trade = sell.value().trades[0];
    EXPECT_EQ(trade.price, 100);
    EXPECT_EQ(trade.quantity, 4);
    EXPECT_EQ(trade.maker_order_id, buy.value().order_id);
    EXPECT_EQ(trade.taker_order_id, sell.value().order_id);
    EXPECT_EQ(trade.taker_side, Side::SELL);
    EXPECT_EQ(trade.buy_order_id(), buy.value().order_id);

    auto resting = engine->book().find(buy.value().order_id);
    ASSERT_TRUE(resting.has_value());
    EXPECT_EQ(resting->remaining_quantity, 6);
    EXPECT_EQ(resting->price, 100);
    EXPECT_EQ(engine->book().level_quantity(Side::BUY, 100), 6);
}

TEST_F(MatchingEngineTest, TradesAtMakerPrice) {
    ASSERT_TRUE(submit(Side::SELL, 101, 5));

    auto buy = submit(Side::BUY, 102, 5);
    ASSERT_TRUE(buy);
    ASSERT_EQ(buy.value().trades.size(), 1u);
    EXPECT_EQ(buy.value().trades[0].price, 101);
    EXPECT_EQ(buy.value().trades[0].quantity, 5);

    EXPECT_FALSE(engine->book().best_ask().has_value());
    EXPECT_FALSE(engine->book().best_bid().has_value());
}

TEST_F(MatchingEngineTest, FifoAtEqualPrice) {
    auto first = submit(Side::SELL, 100, 3, 1);
    auto second = submit(Side::SELL, 100, 3, 2);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    auto buy = submit(Side::BUY, 100, 4, 3);
    ASSERT_TRUE(buy);
    ASSERT_EQ(buy.value().trades.size(), 2u);
    EXPECT_EQ(buy.value().trades[0].maker_order_id, first.value().order_id);
    EXPECT_EQ(buy.value().trades[0].quantity, 3);
    EXPECT_EQ(buy.value().trades[1].maker_order_id, second.value().order_id);
    EXPECT_EQ(buy.value().trades[1].quantity, 1);

    EXPECT_FALSE(engine->book().contains(first.value().order_id));
    EXPECT_EQ(engine->book().find(second.value().order_id)->remaining_quantity, 2);
}

TEST_F(MatchingEngineTest, SweepsLevelsBestFirstAndRestsRemainder) {
    ASSERT_TRUE(submit(Side::SELL, 103, 2));
    ASSERT_TRUE(submit(Side::SELL, 101, 2));
    ASSERT_TRUE(submit(Side::SELL, 102, 2));

    auto buy = submit(Side::BUY, 102, 5);
    ASSERT_TRUE(buy);
    EXPECT_EQ(buy.value().status, OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(buy.value().filled_quantity, 4);
    EXPECT_EQ(buy.value().remaining_quantity, 1);

    ASSERT_EQ(buy.value().trades.size(), 2u);
    EXPECT_EQ(buy.value().trades[0].price, 101);
    EXPECT_EQ(buy.value().trades[1].price, 102);

    EXPECT_EQ(engine->book().best_bid(), 102);
    EXPECT_EQ(engine->book().best_ask(), 103);
    EXPECT_EQ(engine->book().level_quantity(Side::BUY, 102), 1);
    EXPECT_TRUE(engine->book().check_invariants());
}

TEST_F(MatchingEngineTest, NonCrossingOrdersRest) {
    ASSERT_TRUE(submit(Side::BUY, 99, 5));
    ASSERT_TRUE(submit(Side::SELL, 100, 5));

    EXPECT_TRUE(trades.empty());
    EXPECT_EQ(engine->book().best_bid(), 99);
    EXPECT_EQ(engine->book().best_ask(), 100);
}

TEST_F(MatchingEngineTest, OrderIdsIncrease) {
    auto a = submit(Side::BUY, 90, 1);
    auto b = submit(Side::BUY, 91, 1);
    auto c = submit(Side::SELL, 95, 1);
    ASSERT_TRUE(a && b && c);
    EXPECT_LT(a.value().order_id, b.value().order_id);
    EXPECT_LT(b.value().order_id, c.value().order_id);
}

TEST_F(MatchingEngineTest, RejectsInvalidOrders) {
    EXPECT_TRUE(submit(Side::BUY, 0, 10).is(ErrorCode::ORDER_INVALID));
    EXPECT_TRUE(submit(Side::BUY, -1, 10).is(ErrorCode::ORDER_INVALID));
    EXPECT_TRUE(submit(Side::BUY, 100, 0).is(ErrorCode::ORDER_INVALID));
    EXPECT_TRUE(submit(Side::SELL, 100, -3).is(ErrorCode::ORDER_INVALID));
    EXPECT_TRUE(engine->submit(NewOrder{"MSFT", Side::BUY, 100, 1, 1}).is(ErrorCode::ORDER_INVALID));

    EXPECT_EQ(engine->book().order_count(), 0u);
    EXPECT_EQ(engine->stats().orders_rejected, 5u);
    EXPECT_EQ(engine->orders_processed(), 0u);
}

TEST_F(MatchingEngineTest, EnforcesTickAndLotSize) {
    MatchingEngine futures(SymbolConfig{"ES", 25, 10, 0}, 16);

    EXPECT_TRUE(futures.submit(NewOrder{"ES", Side::BUY, 5010, 10, 1}).is(ErrorCode::ORDER_INVALID));
    EXPECT_TRUE(futures.submit(NewOrder{"ES", Side::BUY, 5000, 15, 1}).is(ErrorCode::ORDER_INVALID));
    EXPECT_TRUE(futures.submit(NewOrder{"ES", Side::BUY, 5000, 20, 1}));
}

TEST_F(MatchingEngineTest, CancelIsIdempotent) {
    auto buy = submit(Side::BUY, 100, 10);
    ASSERT_TRUE(buy);

    EXPECT_TRUE(engine->cancel(buy.value().order_id));
    EXPECT_FALSE(engine->book().best_bid().has_value());

    auto again = engine->cancel(buy.value().order_id);
    EXPECT_TRUE(again.is(ErrorCode::ORDER_NOT_FOUND));
    EXPECT_TRUE(engine->cancel(12345).is(ErrorCode::ORDER_NOT_FOUND));

    EXPECT_EQ(engine->stats().orders_cancelled, 1u);
    EXPECT_TRUE(engine->book().check_invariants());
}

TEST_F(MatchingEngineTest, CancelAfterFullFillIsNotFound) {
    auto sell = submit(Side::SELL, 100, 5, 1);
    ASSERT_TRUE(sell);
    ASSERT_TRUE(submit(Side::BUY, 100, 5, 2));

    EXPECT_TRUE(engine->cancel(sell.value().order_id).is(ErrorCode::ORDER_NOT_FOUND));
    EXPECT_EQ(engine->book().order_count(), 0u);
}

TEST_F(MatchingEngineTest, FullBookStillTrades) {
    MatchingEngine small(SymbolConfig{"AAPL", 1, 1, 0}, 2);
    ASSERT_TRUE(small.submit(NewOrder{"AAPL", Side::BUY, 100, 5, 1}));
    ASSERT_TRUE(small.submit(NewOrder{"AAPL", Side::BUY, 99, 5, 1}));
    ASSERT_FALSE(small.book().has_capacity());

    // Fully filled taker needs no slot
    auto sell = small.submit(NewOrder{"AAPL", Side::SELL, 100, 3, 2});
    ASSERT_TRUE(sell);
    ASSERT_EQ(sell.value().trades.size(), 1u);
    EXPECT_EQ(sell.value().trades[0].price, 100);
    EXPECT_EQ(sell.value().trades[0].quantity, 3);
    EXPECT_EQ(sell.value().status, OrderStatus::FILLED);
    EXPECT_EQ(small.book().level_quantity(Side::BUY, 100), 2);

    // Remainder rests in the slot its fill freed
    auto sweep = small.submit(NewOrder{"AAPL", Side::SELL, 100, 4, 2});
    ASSERT_TRUE(sweep);
    EXPECT_EQ(sweep.value().status, OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(sweep.value().remaining_quantity, 2);
    EXPECT_EQ(small.book().best_ask(), 100);
    EXPECT_TRUE(small.book().check_invariants());
}

TEST_F(MatchingEngineTest, FullBookRefusesOrderThatOnlyRests) {
    MatchingEngine small(SymbolConfig{"AAPL", 1, 1, 0}, 2);
    ASSERT_TRUE(small.submit(NewOrder{"AAPL", Side::BUY, 100, 5, 1}));
    ASSERT_TRUE(small.submit(NewOrder{"AAPL", Side::BUY, 99, 5, 1}));

    auto sell = small.submit(NewOrder{"AAPL", Side::SELL, 101, 3, 2});
    EXPECT_TRUE(sell.is(ErrorCode::MEMORY_POOL_EXHAUSTED));

    // Nothing traded, nothing moved
    EXPECT_EQ(small.trades_executed(), 0u);
    EXPECT_EQ(small.book().level_quantity(Side::BUY, 100), 5);
    EXPECT_FALSE(small.book().best_ask().has_value());
}

TEST_F(MatchingEngineTest, CallbackSeesEveryTrade) {
    ASSERT_TRUE(submit(Side::SELL, 100, 2));
    ASSERT_TRUE(submit(Side::SELL, 100, 2));
    ASSERT_TRUE(submit(Side::SELL, 101, 2));
    ASSERT_TRUE(submit(Side::BUY, 101, 6));

    ASSERT_EQ(trades.size(), 3u);
    EXPECT_LT(trades[0].id, trades[1].id);
    EXPECT_LT(trades[1].id, trades[2].id);

    auto stats = engine->stats();
    EXPECT_EQ(stats.trades_executed, 3u);
    EXPECT_EQ(stats.volume_traded, 6u);
    EXPECT_EQ(stats.orders_processed, 4u);
}

TEST_F(MatchingEngineTest, InvariantsHoldUnderRandomFlow) {
    std::mt19937 gen(7);
    std::uniform_int_distribution<> side_dist(0, 1);
    std::uniform_int_distribution<> price_dist(95, 105);
    std::uniform_int_distribution<> qty_dist(1, 20);
    std::uniform_int_distribution<> action_dist(0, 3);

    std::vector<OrderID> ids;
    for (int i = 0; i < 2000; ++i) {
        if (action_dist(gen) == 0 && !ids.empty()) {
            size_t pick = static_cast<size_t>(gen()) % ids.size();
            auto cancelled = engine->cancel(ids[pick]);
            EXPECT_TRUE(cancelled || cancelled.is(ErrorCode::ORDER_NOT_FOUND));
            ids.erase(ids.begin() + static_cast<std::ptrdiff_t>(pick));
        } else {
            auto result = submit(side_dist(gen) ? Side::BUY : Side::SELL, price_dist(gen), qty_dist(gen));
            if (result.is(ErrorCode::MEMORY_POOL_EXHAUSTED)) continue;
            ASSERT_TRUE(result);
            if (result.value().remaining_quantity > 0) ids.push_back(result.value().order_id);
        }
        ASSERT_TRUE(engine->book().check_invariants()) << "after operation " << i;
    }
}

} // namespace shardex
