#pragma once

#include "shardex/types.hpp"
#include <string>
#include <variant>

namespace shardex {

struct NewOrder {
    std::string symbol;
    Side side{Side::BUY};
    Price price{0};
    Quantity quantity{0};
    ClientID client_id{DEFAULT_CLIENT};
};

struct CancelOrder {
    std::string symbol;
    OrderID order_id{0};
};

// Closed set of requests transport translators hand to the exchange
using OrderRequest = std::variant<NewOrder, CancelOrder>;

inline const std::string& request_symbol(const OrderRequest& request) {
    return std::visit([](const auto& r) -> const std::string& { return r.symbol; }, request);
}

} // namespace shardex
