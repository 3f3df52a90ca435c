#include "oms/order_book_registry.hpp"

namespace oms {

OrderBookRegistry::BookSlot& OrderBookRegistry::get_or_create(const std::string& symbol)
{
    {
        std::shared_lock<std::shared_mutex> lock(books_mutex_);
        auto it = books_.find(symbol);
        if (it != books_.end())
            return *it->second;
    }

    std::unique_lock<std::shared_mutex> lock(books_mutex_);
    auto& slot = books_[symbol];   // another writer may have won the race
    if (!slot)
        slot = std::make_unique<BookSlot>(symbol);
    return *slot;
}

OrderBookRegistry::BookSlot* OrderBookRegistry::find(const std::string& symbol)
{
    std::shared_lock<std::shared_mutex> lock(books_mutex_);
    auto it = books_.find(symbol);
    return it == books_.end() ? nullptr : it->second.get();
}

const OrderBookRegistry::BookSlot* OrderBookRegistry::find(const std::string& symbol) const
{
    std::shared_lock<std::shared_mutex> lock(books_mutex_);
    auto it = books_.find(symbol);
    return it == books_.end() ? nullptr : it->second.get();
}

std::vector<std::string> OrderBookRegistry::symbols() const
{
    std::shared_lock<std::shared_mutex> lock(books_mutex_);

    std::vector<std::string> out;
    out.reserve(books_.size());
    for (const auto& [symbol, slot] : books_)
        out.push_back(symbol);
    return out;
}

std::size_t OrderBookRegistry::book_count() const
{
    std::shared_lock<std::shared_mutex> lock(books_mutex_);
    return books_.size();
}

bool OrderBookRegistry::claim_order(OrderId id, const std::string& symbol)
{
    std::lock_guard<std::mutex> lock(ids_mutex_);
    return order_symbols_.emplace(id, symbol).second;
}

void OrderBookRegistry::release_order(OrderId id)
{
    std::lock_guard<std::mutex> lock(ids_mutex_);
    order_symbols_.erase(id);
}

std::optional<std::string> OrderBookRegistry::symbol_of(OrderId id) const
{
    std::lock_guard<std::mutex> lock(ids_mutex_);
    auto it = order_symbols_.find(id);
    if (it == order_symbols_.end())
        return std::nullopt;
    return it->second;
}

std::size_t OrderBookRegistry::order_count() const
{
    std::lock_guard<std::mutex> lock(ids_mutex_);
    return order_symbols_.size();
}

} // namespace oms
