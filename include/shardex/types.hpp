#pragma once

#include <cstdint>
#include <chrono>
#include <string>

namespace shardex {

using OrderID = uint64_t;
using ClientID = uint32_t;
using Price = int64_t;     // Integer price units, tick-aligned per symbol
using Quantity = int64_t;
using TradeID = uint64_t;
using Timestamp = std::chrono::steady_clock::time_point;

constexpr ClientID DEFAULT_CLIENT = 0;

enum class Side : uint8_t {
    BUY = 1,
    SELL = 2
};

inline Side opposite(Side side) {
    return side == Side::BUY ? Side::SELL : Side::BUY;
}

inline const char* to_string(Side side) {
    return side == Side::BUY ? "BUY" : "SELL";
}

enum class OrderStatus : uint8_t {
    NEW = 0,
    PARTIALLY_FILLED = 1,
    FILLED = 2,
    CANCELLED = 3,
    REJECTED = 4
};

const char* to_string(OrderStatus status);

struct Order {
    OrderID id{0};
    std::string symbol;
    ClientID client_id{DEFAULT_CLIENT};
    Side side{Side::BUY};
    Price price{0};
    Quantity quantity{0};
    Quantity remaining_quantity{0};
    OrderStatus status{OrderStatus::NEW};
    Timestamp timestamp{};

    Order() = default;
    Order(OrderID id, std::string sym, ClientID client, Side s, Price p, Quantity qty)
        : id(id), symbol(std::move(sym)), client_id(client), side(s), price(p),
          quantity(qty), remaining_quantity(qty), status(OrderStatus::NEW),
          timestamp(std::chrono::steady_clock::now()) {}

    Quantity filled_quantity() const { return quantity - remaining_quantity; }
};

// Immutable record of one maker order being (partially) consumed by a taker.
struct Trade {
    TradeID id;
    OrderID taker_order_id;
    OrderID maker_order_id;
    std::string symbol;
    Side taker_side;
    ClientID taker_client;
    ClientID maker_client;
    Price price;
    Quantity quantity;
    Timestamp timestamp;

    Trade(TradeID id, OrderID taker, OrderID maker, std::string sym, Side side,
          ClientID taker_cl, ClientID maker_cl, Price p, Quantity qty)
        : id(id), taker_order_id(taker), maker_order_id(maker), symbol(std::move(sym)),
          taker_side(side), taker_client(taker_cl), maker_client(maker_cl),
          price(p), quantity(qty), timestamp(std::chrono::steady_clock::now()) {}

    OrderID buy_order_id() const { return taker_side == Side::BUY ? taker_order_id : maker_order_id; }
    OrderID sell_order_id() const { return taker_side == Side::SELL ? taker_order_id : maker_order_id; }
};

struct DepthLevel {
    Price price;
    Quantity quantity;
    uint32_t order_count;

    bool operator==(const DepthLevel&) const = default;
};

} // namespace shardex
