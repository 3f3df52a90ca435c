#pragma once

#include <cstdint>
#include <string>

#include "oms/order_book.hpp"
#include "oms/types.hpp"

namespace oms {

/**
 * Execute a `side` request of `amount` units against the counter side of
 * `book`, consuming resting orders in price-time priority.
 *
 * All-or-nothing: the fills are planned on a read-only walk first and only
 * applied once the whole amount is covered. Orders that reach zero are
 * removed; partially filled orders keep their id and queue position.
 *
 * Throws InvalidRequest if amount <= 0 (or the cost overflows),
 * InsufficientLiquidity if the counter side holds less than `amount`.
 * In both cases the book is left untouched.
 */
Trade execute_trade(OrderBook&   book,
                    Side         side,
                    Quantity     amount,
                    std::string  trade_id,
                    std::int64_t executed_at_ms);

} // namespace oms
