#include "oms/price_calculator.hpp"

#include <string>

#include "oms/errors.hpp"
#include "oms/liquidity.hpp"

namespace oms {

Price calculate_price(const OrderBook& book, Side side, Quantity amount)
{
    if (amount <= 0)
        throw InvalidRequest("amount must be positive, got " + std::to_string(amount));

    const Quantity available = book.total_amount(counter_side(side));
    if (available < amount)
        throw InsufficientLiquidity(side, amount, available);

    Price total = 0;
    Quantity remaining = walk_liquidity(
        book.peek_side(counter_side(side)),
        amount,
        [&total](const Order& ord, Quantity take) {
            total = checked_add(total, checked_cost(ord.price, take));
        }
    );

    if (remaining > 0)
        throw InsufficientLiquidity(side, amount, amount - remaining);

    return total;
}

} // namespace oms
