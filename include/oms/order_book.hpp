#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <list>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "oms/types.hpp"

namespace oms {

/**
 * In-memory book of resting orders for a single symbol.
 *
 * Design
 *  - Two price books, both Price -> Level with a side-aware comparator:
 *      * bids_ : best (highest) bid at begin().
 *      * asks_ : best (lowest)  ask at begin().
 *  - Each Level is a FIFO of indices into a flat vector<Slot> orders_,
 *    so equal-price orders keep their arrival sequence.
 *  - id_to_index_ maps external OrderId to the index in orders_.
 *  - free_indices_ stores reusable indices in orders_.
 *  - Every slot remembers its position inside its level queue, which makes
 *    removal by id O(log levels) without scanning the level.
 *
 * All methods are NOT thread-safe; external synchronisation is required
 * if the book is shared between threads (see OrderBookRegistry::BookSlot).
 */
class OrderBook
{
public:
    class SideView;

    explicit OrderBook(std::string symbol);

    // slots hold iterators into the level queues: copying would alias them
    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;
    OrderBook(OrderBook&&) = default;
    OrderBook& operator=(OrderBook&&) = default;

    const std::string& symbol() const noexcept { return symbol_; }

    /// True if there are no resting bids and asks.
    bool empty() const noexcept;

    /// Number of resting orders on both sides.
    std::size_t size() const noexcept;

    /// Remove all orders and reset internal state.
    void clear() noexcept;

    /// Aggregate best bid (highest price) with total quantity at that level.
    BestQuote best_bid() const noexcept;

    /// Aggregate best ask (lowest price) with total quantity at that level.
    BestQuote best_ask() const noexcept;

    BestQuote best(Side side) const noexcept;

    /// Sum of remaining amounts on one side.
    Quantity total_amount(Side side) const noexcept;

    /// Add a resting order behind all orders already resting at its price.
    /// Throws InvalidOrder for a non-positive amount, a negative price or a
    /// symbol of another book, DuplicateOrder if the id is already resting.
    void insert(const Order& order);

    /// Throws OrderNotFound if the id is not resting in this book.
    void remove(OrderId id);

    bool contains(OrderId id) const noexcept;

    /// Throws OrderNotFound if the id is not resting in this book.
    const Order& get(OrderId id) const;

    /// Live, read-only walk over one side in price-time priority.
    /// Any mutation of the book invalidates views and their iterators.
    SideView peek_side(Side side) const noexcept;

    /// Take qty (0 < qty <= amount) from a resting order in place.
    /// Returns true if the order was used up and removed from the book.
    bool fill(OrderId id, Quantity qty);

    BookSnapshot snapshot() const;

private:
    using OrderIndex = std::uint32_t;
    using LevelQueue = std::list<OrderIndex>;

    struct Slot
    {
        Order                order;
        LevelQueue::iterator pos;
        bool                 active{false};
    };

    struct Level
    {
        LevelQueue queue;   // arrival order
        Quantity   qty{0};  // aggregated remaining amount
    };

    /// Best price first: descending for bids, ascending for asks.
    struct PriceOrder
    {
        Side side{Side::Buy};

        bool operator()(Price lhs, Price rhs) const noexcept
        {
            return side == Side::Buy ? lhs > rhs : lhs < rhs;
        }
    };

    using Book = std::map<Price, Level, PriceOrder>;

    OrderIndex allocate_slot();
    void       release_slot(OrderIndex idx);

    Book&       book_for(Side side) noexcept;
    const Book& book_for(Side side) const noexcept;

    /// Unlink a slot from its level (dropping the level once empty),
    /// from the id index and from the side totals.
    void unlink(OrderIndex idx);

    std::string symbol_;

    Book bids_{PriceOrder{Side::Buy}};
    Book asks_{PriceOrder{Side::Sell}};

    std::vector<Slot>       orders_;        // indexed by OrderIndex (0-based)
    std::vector<OrderIndex> free_indices_;  // free slots for reuse
    std::unordered_map<OrderId, OrderIndex> id_to_index_;

    Quantity bid_qty_{0};
    Quantity ask_qty_{0};
};

/**
 * Forward range over the resting orders of one side, best price first and
 * arrival order within a price. Nothing is copied: every dereference reads
 * the book as it is now, and a fresh view can be taken at any time.
 */
class OrderBook::SideView
{
public:
    class const_iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Order;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Order*;
        using reference         = const Order&;

        const_iterator() = default;

        reference operator*() const { return book_->orders_[*pos_].order; }
        pointer   operator->() const { return &**this; }

        const_iterator& operator++()
        {
            if (++pos_ == level_->second.queue.end())
            {
                ++level_;
                if (level_ != level_end_)
                    pos_ = level_->second.queue.begin();
            }
            return *this;
        }

        const_iterator operator++(int)
        {
            const_iterator prev = *this;
            ++*this;
            return prev;
        }

        bool operator==(const const_iterator& other) const
        {
            if (level_ != other.level_)
                return false;
            return level_ == level_end_ || pos_ == other.pos_;
        }

        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class OrderBook::SideView;

        const_iterator(const OrderBook* book,
                       Book::const_iterator level,
                       Book::const_iterator level_end)
            : book_(book), level_(level), level_end_(level_end)
        {
            // levels are erased as soon as they run empty
            if (level_ != level_end_)
                pos_ = level_->second.queue.begin();
        }

        const OrderBook*            book_{nullptr};
        Book::const_iterator        level_;
        Book::const_iterator        level_end_;
        LevelQueue::const_iterator  pos_;
    };

    const_iterator begin() const { return const_iterator(book_, levels_->begin(), levels_->end()); }
    const_iterator end() const { return const_iterator(book_, levels_->end(), levels_->end()); }

    bool empty() const noexcept { return levels_->empty(); }
    Side side() const noexcept { return side_; }

private:
    friend class OrderBook;

    SideView(const OrderBook* book, const Book* levels, Side side) noexcept
        : book_(book), levels_(levels), side_(side) {}

    const OrderBook* book_;
    const Book*      levels_;
    Side             side_;
};

} // namespace oms
