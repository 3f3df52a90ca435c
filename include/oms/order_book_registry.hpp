#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "oms/order_book.hpp"
#include "oms/types.hpp"

namespace oms {

/**
 * Owner of every order book, one per symbol, created on first reference.
 *
 * Each book lives in a BookSlot next to its own reader/writer lock; the
 * registry never takes that lock itself. Slots are never destroyed while the
 * registry lives, so a BookSlot& stays valid after the registry lock is
 * released and operations on different symbols never contend.
 *
 * The registry also keeps the system-wide order id index (id -> symbol),
 * which makes order ids unique across all books.
 *
 * Lock order: a slot mutex may be held while calling into the id index,
 * never the other way round.
 */
class OrderBookRegistry
{
public:
    struct BookSlot
    {
        explicit BookSlot(std::string symbol) : book(std::move(symbol)) {}

        mutable std::shared_mutex mutex;
        OrderBook                 book;
    };

    OrderBookRegistry() = default;
    OrderBookRegistry(const OrderBookRegistry&) = delete;
    OrderBookRegistry& operator=(const OrderBookRegistry&) = delete;

    /// Slot for symbol, created empty if it does not exist yet.
    BookSlot& get_or_create(const std::string& symbol);

    /// nullptr if no book was ever created for symbol.
    BookSlot* find(const std::string& symbol);
    const BookSlot* find(const std::string& symbol) const;

    /// Known symbols in lexicographic order.
    std::vector<std::string> symbols() const;

    std::size_t book_count() const;

    /// Reserve id for symbol. Returns false if the id is already in use.
    bool claim_order(OrderId id, const std::string& symbol);

    /// Forget id. No-op if it is unknown.
    void release_order(OrderId id);

    /// Symbol of the book holding id, if any.
    std::optional<std::string> symbol_of(OrderId id) const;

    std::size_t order_count() const;

private:
    mutable std::shared_mutex books_mutex_;
    std::map<std::string, std::unique_ptr<BookSlot>> books_;

    mutable std::mutex ids_mutex_;
    std::unordered_map<OrderId, std::string> order_symbols_;
};

} // namespace oms
