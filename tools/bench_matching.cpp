#include "shardex/exchange.hpp"
#include "shardex/logger.hpp"
#include "shardex/matching_engine.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

namespace shardex {

void benchmark_matching_engine() {
    constexpr size_t pool_size = 100000;
    constexpr size_t num_orders = 200000;

    SymbolConfig symbol{"AAPL", 1, 1, 0};
    MatchingEngine engine(symbol, pool_size);

    std::mt19937 gen(42);
    std::uniform_int_distribution<> side_dist(1, 2);
    std::uniform_int_distribution<> price_dist(14900, 15100);
    std::uniform_int_distribution<> qty_dist(100, 1000);

    size_t rejected = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < num_orders; ++i) {
        NewOrder order{"AAPL", side_dist(gen) == 1 ? Side::BUY : Side::SELL,
                       price_dist(gen), qty_dist(gen), static_cast<ClientID>(i % 16)};
        if (!engine.submit(order)) {
            ++rejected;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);

    std::cout << "Matching Engine Benchmark:\n";
    std::cout << "  Orders processed: " << engine.orders_processed() << "\n";
    std::cout << "  Orders rejected: " << rejected << "\n";
    std::cout << "  Trades executed: " << engine.trades_executed() << "\n";
    std::cout << "  Resting orders: " << engine.book().order_count() << "\n";
    std::cout << "  Total time: " << duration.count() / 1000.0 << " ms\n";
    std::cout << "  Avg latency: " << static_cast<double>(duration.count()) / num_orders << " us/order\n";
    std::cout << "  Throughput: " << (num_orders * 1e6) / duration.count() << " orders/sec\n\n";
}

void benchmark_exchange_threads() {
    constexpr int num_threads = 4;
    constexpr size_t orders_per_thread = 50000;

    auto config = std::make_unique<Config>(Config::defaults());
    config->engine.order_pool_size = 200000;
    Exchange exchange(std::move(config));

    const std::vector<std::string> symbols{"AAPL", "MSFT", "GOOGL"};
    std::vector<std::thread> threads;

    auto start = std::chrono::high_resolution_clock::now();

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            std::mt19937 gen(1000 + t);
            std::uniform_int_distribution<> side_dist(1, 2);
            std::uniform_int_distribution<> price_dist(9900, 10100);
            std::uniform_int_distribution<> qty_dist(1, 100);

            for (size_t i = 0; i < orders_per_thread; ++i) {
                const auto& symbol = symbols[i % symbols.size()];
                auto submitted = exchange.submit_order(symbol, side_dist(gen) == 1 ? Side::BUY : Side::SELL,
                                                       price_dist(gen), qty_dist(gen), static_cast<ClientID>(t));
                if (!submitted) {
                    std::this_thread::yield();
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    auto stats = exchange.stats();
    const size_t total = num_threads * orders_per_thread;

    std::cout << "Exchange Benchmark (" << num_threads << " threads, " << symbols.size() << " symbols):\n";
    std::cout << "  Orders processed: " << stats.orders_processed << "\n";
    std::cout << "  Trades executed: " << stats.trades_executed << "\n";
    std::cout << "  Volume traded: " << stats.volume_traded << "\n";
    std::cout << "  Total time: " << duration.count() / 1000.0 << " ms\n";
    std::cout << "  Throughput: " << (total * 1e6) / duration.count() << " orders/sec\n";
}

} // namespace shardex

int main() {
    shardex::Logger::instance().set_level(shardex::LogLevel::WARN);

    std::cout << "Matching Engine Benchmarks\n";
    std::cout << "===========================\n\n";

    shardex::benchmark_matching_engine();
    shardex::benchmark_exchange_threads();

    return 0;
}
