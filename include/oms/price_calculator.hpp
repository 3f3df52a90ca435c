#pragma once

#include "oms/order_book.hpp"
#include "oms/types.hpp"

namespace oms {

/// Total cost of taking `amount` units for a `side` request from the resting
/// counter-side liquidity of `book`: a BUY is priced against asks lowest price
/// first, a SELL against bids highest price first. Read-only.
///
/// Throws InvalidRequest if amount <= 0, InsufficientLiquidity if the counter
/// side holds less than `amount` (no partial price is returned).
Price calculate_price(const OrderBook& book, Side side, Quantity amount);

} // namespace oms
