#include "oms/trade_executor.hpp"

#include <utility>
#include <vector>

#include "oms/errors.hpp"
#include "oms/liquidity.hpp"

namespace oms {

Trade execute_trade(OrderBook&   book,
                    Side         side,
                    Quantity     amount,
                    std::string  trade_id,
                    std::int64_t executed_at_ms)
{
    if (amount <= 0)
        throw InvalidRequest("amount must be positive, got " + std::to_string(amount));

    const Quantity available = book.total_amount(counter_side(side));
    if (available < amount)
        throw InsufficientLiquidity(side, amount, available);

    Trade trade;
    trade.trade_id       = std::move(trade_id);
    trade.symbol         = book.symbol();
    trade.side           = side;
    trade.amount         = amount;
    trade.executed_at_ms = executed_at_ms;

    // Plan: nothing below may touch the book until the plan is complete.
    Quantity remaining = walk_liquidity(
        book.peek_side(counter_side(side)),
        amount,
        [&trade](const Order& ord, Quantity take) {
            trade.total_price = checked_add(trade.total_price, checked_cost(ord.price, take));
            trade.fills.push_back(OrderFill{ord.id, take, ord.price});
        }
    );

    if (remaining > 0)
        throw InsufficientLiquidity(side, amount, amount - remaining);

    // Apply.
    for (const OrderFill& f : trade.fills)
        book.fill(f.order_id, f.filled_amount);

    return trade;
}

} // namespace oms
