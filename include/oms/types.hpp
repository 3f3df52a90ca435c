#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oms {

using Price    = std::int64_t;   // price per unit in cents
using Quantity = std::int64_t;
using OrderId  = std::uint64_t;

enum class Side {
    Buy,
    Sell
};

/// Side whose resting orders an incoming request of `side` consumes.
constexpr Side counter_side(Side side) noexcept
{
    return side == Side::Buy ? Side::Sell : Side::Buy;
}

const char* to_string(Side side) noexcept;

/// Accepts BUY/SELL and B/S, case-insensitive.
std::optional<Side> parse_side(std::string_view token);

struct Order {
    OrderId     id{0};
    std::string symbol;
    Side        side{Side::Buy};
    Quantity    amount{0};   // remaining quantity
    Price       price{0};
};

struct BestQuote {
    Price price{};
    Quantity qty{};
    bool valid{false};
};

struct OrderFill {
    OrderId  order_id{0};
    Quantity filled_amount{0};
    Price    unit_price{0};
};

struct Trade {
    std::string            trade_id;
    std::string            symbol;
    Side                   side{Side::Buy};
    Quantity               amount{0};        // requested == filled
    Price                  total_price{0};
    std::int64_t           executed_at_ms{0};
    std::vector<OrderFill> fills;            // in consumption order
};

/// Priority-ordered copy of one book, best price first on both sides.
struct BookSnapshot {
    std::string        symbol;
    std::vector<Order> bids;
    std::vector<Order> asks;
};

} // namespace oms
