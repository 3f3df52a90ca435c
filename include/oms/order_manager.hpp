#pragma once

#include <string>

#include "oms/config.hpp"
#include "oms/order_book_registry.hpp"
#include "oms/trade_id.hpp"
#include "oms/types.hpp"

namespace oms {

/**
 * Entry point of the order management core: add, remove, price and trade.
 *
 * Books come from the registry passed in (it must outlive the manager), so
 * independent managers can be built over independent registries.
 *
 * Thread safety: every call may be made from any thread. Mutating calls
 * (add_order, remove_order, place_trade) hold the exclusive lock of the one
 * book they touch; read-only calls hold its shared lock. Calls on different
 * symbols do not block each other.
 *
 * Every operation either completes or throws one oms::Error subclass and
 * leaves all books unchanged.
 */
class OrderManager {
public:
    explicit OrderManager(OrderBookRegistry& registry, OmsConfig config = {});

    /// Throws InvalidOrder (amount <= 0, price < 0, limits, bad symbol) or
    /// DuplicateOrder (id resting in any book).
    void add_order(OrderId id, const std::string& symbol, Side side,
                   Quantity amount, Price price);

    /// Throws OrderNotFound if no book holds id.
    void remove_order(OrderId id);

    /// Cost of a `side` request for amount units, see oms::calculate_price.
    /// Throws UnknownSymbol, InvalidRequest or InsufficientLiquidity.
    Price calculate_price(const std::string& symbol, Side side, Quantity amount) const;

    /// Execute a `side` request for amount units, see oms::execute_trade.
    /// Throws UnknownSymbol, InvalidRequest or InsufficientLiquidity.
    Trade place_trade(const std::string& symbol, Side side, Quantity amount);

    /// Copy of a resting order. Throws OrderNotFound.
    Order get_order(OrderId id) const;

    /// Priority-ordered view of a book; empty for a symbol never seen.
    BookSnapshot snapshot(const std::string& symbol) const;

    /// Best level of one side of a book; invalid for a symbol never seen.
    BestQuote best_quote(const std::string& symbol, Side side) const;

    const OmsConfig& config() const noexcept { return config_; }

private:
    const OrderBookRegistry::BookSlot& require_book(const std::string& symbol) const;
    void check_request_amount(Quantity amount) const;

    OrderBookRegistry& registry_;
    OmsConfig          config_;
    TradeIdGenerator   trade_ids_;
};

} // namespace oms
