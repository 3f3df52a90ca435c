#pragma once

#include <algorithm>
#include <limits>
#include <string>

#include "oms/errors.hpp"
#include "oms/order_book.hpp"
#include "oms/types.hpp"

namespace oms {

/// Cost of qty units at unit_price; InvalidRequest if it does not fit in Price.
inline Price checked_cost(Price unit_price, Quantity qty)
{
    if (unit_price != 0 && qty > std::numeric_limits<Price>::max() / unit_price)
        throw InvalidRequest("cost of " + std::to_string(qty) + " @ " +
                             std::to_string(unit_price) + " overflows");
    return unit_price * qty;
}

inline Price checked_add(Price total, Price cost)
{
    if (cost > std::numeric_limits<Price>::max() - total)
        throw InvalidRequest("total price overflows");
    return total + cost;
}

/**
 * Core traversal shared by pricing and execution: visits resting orders of
 * `view` in priority order until `amount` is covered or the side runs out.
 * For every order touched calls on_fill(order, take) with
 * take = min(remaining, order.amount). Never mutates the book.
 *
 * Returns the part of `amount` that could not be covered (0 if fully covered).
 */
template <typename OnFill>
Quantity walk_liquidity(const OrderBook::SideView& view, Quantity amount, OnFill&& on_fill)
{
    Quantity remaining = amount;

    for (auto it = view.begin(); remaining > 0 && it != view.end(); ++it)
    {
        const Order& ord  = *it;
        Quantity     take = std::min(remaining, ord.amount);

        on_fill(ord, take);
        remaining -= take;
    }

    return remaining;
}

} // namespace oms
