/**
 * @file main.cpp
 * @brief shardex simulator entry point
 *
 * Builds an exchange from a config file (or the built-in defaults), drives it
 * with several order-flow threads and prints the resulting top of book,
 * positions and statistics.
 */

#include "shardex/config.hpp"
#include "shardex/exchange.hpp"
#include "shardex/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace shardex {

// Global shutdown flag for early termination
std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested.store(true);
}

struct SimOptions {
    std::string config_path;
    int threads{4};
    int orders_per_thread{10000};
    int clients{8};
    Price mid_price{10000};
};

/**
 * @brief Random limit order flow around a fixed mid price
 *
 * Each thread trades every symbol for random clients and cancels a share of
 * the orders it left resting. Cancels that lose a race to a fill come
 * back as ORDER_NOT_FOUND and are counted, not treated as failures.
 */
void run_flow(Exchange& exchange, const SimOptions& options, int thread_index,
              std::atomic<uint64_t>& lost_cancels) {
    const auto& symbols = exchange.config().symbols;
    std::mt19937 gen(static_cast<unsigned>(thread_index) * 7919u + 17u);
    std::uniform_int_distribution<> side_dist(0, 1);
    std::uniform_int_distribution<> offset_dist(-20, 20);
    std::uniform_int_distribution<> lots_dist(1, 10);
    std::uniform_int_distribution<> cancel_dist(0, 9);
    std::uniform_int_distribution<> client_dist(0, std::max(options.clients - 1, 0));

    std::vector<std::pair<std::string, OrderID>> resting;

    for (int i = 0; i < options.orders_per_thread && !shutdown_requested.load(); ++i) {
        const auto& symbol = symbols[static_cast<size_t>(i) % symbols.size()];
        const Side side = side_dist(gen) == 0 ? Side::BUY : Side::SELL;
        const Price price = (options.mid_price + offset_dist(gen)) * symbol.tick_size;
        const Quantity quantity = lots_dist(gen) * symbol.lot_size;
        const ClientID client = static_cast<ClientID>(client_dist(gen));

        auto result = exchange.submit(NewOrder{symbol.symbol, side, price, quantity, client});
        if (result && result.value().remaining_quantity > 0) {
            resting.emplace_back(symbol.symbol, result.value().order_id);
        }

        if (!resting.empty() && cancel_dist(gen) < 3) {
            auto [cancel_symbol, order_id] = resting.back();
            resting.pop_back();
            auto cancelled = exchange.cancel_order(cancel_symbol, order_id);
            if (cancelled.is(ErrorCode::ORDER_NOT_FOUND)) {
                lost_cancels.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }
}

void print_report(const Exchange& exchange, uint64_t lost_cancels) {
    std::cout << "\n=== Top of Book ===\n";
    for (const auto& symbol : exchange.config().symbols) {
        auto snapshot = exchange.snapshot(symbol.symbol);
        std::cout << symbol.symbol << ": ";
        if (snapshot && snapshot->best_bid) std::cout << "bid " << *snapshot->best_bid;
        else std::cout << "bid -";
        if (snapshot && snapshot->best_ask) std::cout << " / ask " << *snapshot->best_ask;
        else std::cout << " / ask -";
        if (snapshot) std::cout << " (version " << snapshot->version << ")";
        std::cout << "\n";
    }

    std::cout << "\n=== Positions ===\n";
    for (const auto& position : exchange.positions()) {
        if (position.is_flat() && position.realized_pnl == 0.0) continue;
        std::cout << "client " << position.client_id << " " << position.symbol
                  << " qty " << position.quantity
                  << " avg " << position.avg_price
                  << " realized " << position.realized_pnl << "\n";
    }

    auto stats = exchange.stats();
    std::cout << "\n=== Statistics ===\n";
    std::cout << "Orders processed: " << stats.orders_processed << "\n";
    std::cout << "Orders rejected: " << stats.orders_rejected << "\n";
    std::cout << "Orders cancelled: " << stats.orders_cancelled << "\n";
    std::cout << "Cancels lost to fills: " << lost_cancels << "\n";
    std::cout << "Trades executed: " << stats.trades_executed << "\n";
    std::cout << "Volume traded: " << stats.volume_traded << "\n";
}

int run_simulation(const SimOptions& options) {
    auto config = options.config_path.empty()
        ? std::make_unique<Config>(Config::defaults())
        : Config::load_from_file(options.config_path);
    config->apply_logging();

    Exchange exchange(std::move(config));

    std::atomic<uint64_t> lost_cancels{0};
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(options.threads));

    auto start = std::chrono::steady_clock::now();
    for (int t = 0; t < options.threads; ++t) {
        threads.emplace_back(run_flow, std::ref(exchange), std::cref(options), t, std::ref(lost_cancels));
    }
    for (auto& thread : threads) {
        thread.join();
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    LOG_INFO_SAFE("Simulation finished in {} ms", elapsed.count());
    print_report(exchange, lost_cancels.load());
    return 0;
}

} // namespace shardex

/**
 * @brief Main entry point
 *
 * Usage: shardex_sim [--config <file>] [--threads N] [--orders N] [--clients N]
 */
int main(int argc, char* argv[]) {
    std::signal(SIGINT, shardex::signal_handler);
    std::signal(SIGTERM, shardex::signal_handler);

    shardex::SimOptions options;
    for (int i = 1; i < argc; i += 2) {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << argv[i] << "\n";
            return 1;
        }

        std::string arg = argv[i];
        try {
            if (arg == "--config") {
                options.config_path = argv[i + 1];
            } else if (arg == "--threads") {
                options.threads = std::stoi(argv[i + 1]);
            } else if (arg == "--orders") {
                options.orders_per_thread = std::stoi(argv[i + 1]);
            } else if (arg == "--clients") {
                options.clients = std::stoi(argv[i + 1]);
            } else {
                std::cerr << "Unknown option " << arg << "\n";
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << "\n";
            return 1;
        }
    }

    if (options.threads <= 0 || options.orders_per_thread < 0 || options.clients <= 0) {
        std::cerr << "threads and clients must be positive\n";
        return 1;
    }

    try {
        return shardex::run_simulation(options);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
