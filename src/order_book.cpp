#include "oms/order_book.hpp"

#include <limits>
#include <utility>

#include "oms/errors.hpp"

namespace oms {

OrderBook::OrderBook(std::string symbol)
    : symbol_(std::move(symbol))
{
    orders_.reserve(1024);
    free_indices_.reserve(1024);
}

bool OrderBook::empty() const noexcept
{
    return bids_.empty() && asks_.empty();
}

std::size_t OrderBook::size() const noexcept
{
    return id_to_index_.size();
}

void OrderBook::clear() noexcept
{
    bids_.clear();
    asks_.clear();
    orders_.clear();
    free_indices_.clear();
    id_to_index_.clear();
    bid_qty_ = 0;
    ask_qty_ = 0;
}

OrderBook::OrderIndex OrderBook::allocate_slot()
{
    if (!free_indices_.empty())
    {
        OrderIndex idx = free_indices_.back();
        free_indices_.pop_back();
        return idx;
    }

    if (orders_.size() >= std::numeric_limits<OrderIndex>::max())
        throw InvalidOrder("order book for " + symbol_ + " is full");

    OrderIndex idx = static_cast<OrderIndex>(orders_.size());
    orders_.push_back(Slot{});
    return idx;
}

void OrderBook::release_slot(OrderIndex idx)
{
    Slot& slot  = orders_[idx];
    slot.active = false;
    slot.order  = Order{};
    free_indices_.push_back(idx);
}

OrderBook::Book& OrderBook::book_for(Side side) noexcept
{
    return side == Side::Buy ? bids_ : asks_;
}

const OrderBook::Book& OrderBook::book_for(Side side) const noexcept
{
    return side == Side::Buy ? bids_ : asks_;
}

BestQuote OrderBook::best_bid() const noexcept
{
    return best(Side::Buy);
}

BestQuote OrderBook::best_ask() const noexcept
{
    return best(Side::Sell);
}

BestQuote OrderBook::best(Side side) const noexcept
{
    BestQuote info;
    const Book& book = book_for(side);
    if (book.empty())
        return info;

    // begin() is the best level for both books (depends on comparator)
    const auto& [price, level] = *book.begin();

    info.valid = true;
    info.price = price;
    info.qty   = level.qty;
    return info;
}

Quantity OrderBook::total_amount(Side side) const noexcept
{
    return side == Side::Buy ? bid_qty_ : ask_qty_;
}

void OrderBook::insert(const Order& order)
{
    if (order.amount <= 0)
        throw InvalidOrder("amount must be positive, got " + std::to_string(order.amount));
    if (order.price < 0)
        throw InvalidOrder("price must not be negative, got " + std::to_string(order.price));
    if (order.symbol != symbol_)
        throw InvalidOrder("order for " + order.symbol + " does not belong to book " + symbol_);
    if (id_to_index_.count(order.id) != 0)
        throw DuplicateOrder(order.id);

    OrderIndex idx = allocate_slot();

    Level& level = book_for(order.side)[order.price];
    level.queue.push_back(idx);
    level.qty += order.amount;

    Slot& slot  = orders_[idx];
    slot.order  = order;
    slot.pos    = std::prev(level.queue.end());
    slot.active = true;

    id_to_index_.emplace(order.id, idx);

    if (order.side == Side::Buy)
        bid_qty_ += order.amount;
    else
        ask_qty_ += order.amount;
}

void OrderBook::unlink(OrderIndex idx)
{
    Slot&        slot = orders_[idx];
    const Order& ord  = slot.order;

    Book& book   = book_for(ord.side);
    auto  lvl_it = book.find(ord.price);
    if (lvl_it != book.end())
    {
        Level& level = lvl_it->second;
        level.queue.erase(slot.pos);
        level.qty -= ord.amount;
        if (level.queue.empty())
            book.erase(lvl_it);
    }

    if (ord.side == Side::Buy)
        bid_qty_ -= ord.amount;
    else
        ask_qty_ -= ord.amount;

    id_to_index_.erase(ord.id);
    release_slot(idx);
}

void OrderBook::remove(OrderId id)
{
    auto it = id_to_index_.find(id);
    if (it == id_to_index_.end())
        throw OrderNotFound(id);

    unlink(it->second);
}

bool OrderBook::contains(OrderId id) const noexcept
{
    return id_to_index_.count(id) != 0;
}

const Order& OrderBook::get(OrderId id) const
{
    auto it = id_to_index_.find(id);
    if (it == id_to_index_.end())
        throw OrderNotFound(id);

    return orders_[it->second].order;
}

OrderBook::SideView OrderBook::peek_side(Side side) const noexcept
{
    return SideView(this, &book_for(side), side);
}

bool OrderBook::fill(OrderId id, Quantity qty)
{
    auto it = id_to_index_.find(id);
    if (it == id_to_index_.end())
        throw OrderNotFound(id);

    OrderIndex idx = it->second;
    Order&     ord = orders_[idx].order;

    if (qty <= 0 || qty > ord.amount)
    {
        throw InvalidRequest("cannot fill " + std::to_string(qty) + " of order " +
                             std::to_string(id) + " with " +
                             std::to_string(ord.amount) + " remaining");
    }

    if (qty == ord.amount)
    {
        unlink(idx);
        return true;
    }

    // Price is unchanged, so the order keeps its place in the level.
    ord.amount -= qty;
    book_for(ord.side).find(ord.price)->second.qty -= qty;
    if (ord.side == Side::Buy)
        bid_qty_ -= qty;
    else
        ask_qty_ -= qty;

    return false;
}

BookSnapshot OrderBook::snapshot() const
{
    BookSnapshot snap;
    snap.symbol = symbol_;

    auto bids = peek_side(Side::Buy);
    snap.bids.assign(bids.begin(), bids.end());

    auto asks = peek_side(Side::Sell);
    snap.asks.assign(asks.begin(), asks.end());

    return snap;
}

} // namespace oms
