#include "oms/order_manager.hpp"

#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include "oms/errors.hpp"
#include "oms/price_calculator.hpp"
#include "oms/trade_executor.hpp"

namespace oms {
namespace {

std::int64_t now_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

OrderManager::OrderManager(OrderBookRegistry& registry, OmsConfig config)
    : registry_(registry),
      config_(std::move(config))
{
}

void OrderManager::add_order(OrderId id, const std::string& symbol, Side side,
                             Quantity amount, Price price)
{
    if (amount <= 0 || amount > config_.max_amount)
        throw InvalidOrder("amount must be in [1, " + std::to_string(config_.max_amount) +
                           "], got " + std::to_string(amount));
    if (price < 0 || price > config_.max_price)
        throw InvalidOrder("price must be in [0, " + std::to_string(config_.max_price) +
                           "], got " + std::to_string(price));
    if (!is_valid_symbol(symbol, config_))
        throw InvalidOrder("invalid symbol '" + symbol + "'");

    if (!registry_.claim_order(id, symbol))
        throw DuplicateOrder(id);

    Order order;
    order.id     = id;
    order.symbol = symbol;
    order.side   = side;
    order.amount = amount;
    order.price  = price;

    try
    {
        auto& slot = registry_.get_or_create(symbol);
        std::unique_lock<std::shared_mutex> lock(slot.mutex);
        slot.book.insert(order);
    }
    catch (...)
    {
        registry_.release_order(id);
        throw;
    }
}

void OrderManager::remove_order(OrderId id)
{
    auto symbol = registry_.symbol_of(id);
    if (!symbol)
        throw OrderNotFound(id);

    auto* slot = registry_.find(*symbol);
    if (slot == nullptr)
        throw OrderNotFound(id);

    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    // a trade may have consumed the order since the lookup
    slot->book.remove(id);
    registry_.release_order(id);
}

const OrderBookRegistry::BookSlot& OrderManager::require_book(const std::string& symbol) const
{
    const auto* slot = registry_.find(symbol);
    if (slot == nullptr)
        throw UnknownSymbol(symbol);
    return *slot;
}

void OrderManager::check_request_amount(Quantity amount) const
{
    if (amount <= 0 || amount > config_.max_amount)
        throw InvalidRequest("amount must be in [1, " + std::to_string(config_.max_amount) +
                             "], got " + std::to_string(amount));
}

Price OrderManager::calculate_price(const std::string& symbol, Side side, Quantity amount) const
{
    const auto& slot = require_book(symbol);
    check_request_amount(amount);

    std::shared_lock<std::shared_mutex> lock(slot.mutex);
    return oms::calculate_price(slot.book, side, amount);
}

Trade OrderManager::place_trade(const std::string& symbol, Side side, Quantity amount)
{
    auto* slot = registry_.find(symbol);
    if (slot == nullptr)
        throw UnknownSymbol(symbol);
    check_request_amount(amount);

    std::string trade_id = trade_ids_.next();

    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    Trade trade = execute_trade(slot->book, side, amount, std::move(trade_id), now_ms());

    for (const auto& fill : trade.fills)
    {
        if (!slot->book.contains(fill.order_id))
            registry_.release_order(fill.order_id);
    }

    return trade;
}

Order OrderManager::get_order(OrderId id) const
{
    auto symbol = registry_.symbol_of(id);
    if (!symbol)
        throw OrderNotFound(id);

    const auto* slot = registry_.find(*symbol);
    if (slot == nullptr)
        throw OrderNotFound(id);

    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->book.get(id);
}

BookSnapshot OrderManager::snapshot(const std::string& symbol) const
{
    const auto* slot = registry_.find(symbol);
    if (slot == nullptr)
    {
        BookSnapshot empty;
        empty.symbol = symbol;
        return empty;
    }

    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->book.snapshot();
}

BestQuote OrderManager::best_quote(const std::string& symbol, Side side) const
{
    const auto* slot = registry_.find(symbol);
    if (slot == nullptr)
        return BestQuote{};

    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->book.best(side);
}

} // namespace oms
