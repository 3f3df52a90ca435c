#include "oms/json.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

using nlohmann::json;

namespace oms {

void to_json(json& j, Side side)
{
    j = to_string(side);
}

void from_json(const json& j, Side& side)
{
    auto parsed = parse_side(j.get<std::string>());
    if (!parsed) {
        throw std::runtime_error("invalid side: " + j.dump());
    }
    side = *parsed;
}

void to_json(json& j, const Order& order)
{
    j = json{
        {"order_id", order.id},
        {"symbol",   order.symbol},
        {"side",     order.side},
        {"amount",   order.amount},
        {"price",    order.price},
    };
}

void from_json(const json& j, Order& order)
{
    order.id     = j.at("order_id").get<OrderId>();
    order.symbol = j.at("symbol").get<std::string>();
    order.side   = j.at("side").get<Side>();
    order.amount = j.at("amount").get<Quantity>();
    order.price  = j.at("price").get<Price>();
}

void to_json(json& j, const OrderFill& fill)
{
    j = json{
        {"order_id",      fill.order_id},
        {"filled_amount", fill.filled_amount},
        {"fill_price",    fill.unit_price},
    };
}

void from_json(const json& j, OrderFill& fill)
{
    fill.order_id      = j.at("order_id").get<OrderId>();
    fill.filled_amount = j.at("filled_amount").get<Quantity>();
    fill.unit_price    = j.at("fill_price").get<Price>();
}

void to_json(json& j, const Trade& trade)
{
    j = json{
        {"trade_id",    trade.trade_id},
        {"symbol",      trade.symbol},
        {"side",        trade.side},
        {"amount",      trade.amount},
        {"total_price", trade.total_price},
        {"executed_at", format_utc_ms(trade.executed_at_ms)},
        {"order_fills", trade.fills},
    };
}

void from_json(const json& j, Trade& trade)
{
    trade.trade_id       = j.at("trade_id").get<std::string>();
    trade.symbol         = j.at("symbol").get<std::string>();
    trade.side           = j.at("side").get<Side>();
    trade.amount         = j.at("amount").get<Quantity>();
    trade.total_price    = j.at("total_price").get<Price>();
    trade.executed_at_ms = parse_utc_ms(j.at("executed_at").get<std::string>());
    trade.fills          = j.at("order_fills").get<std::vector<OrderFill>>();
}

void to_json(json& j, const BestQuote& quote)
{
    if (!quote.valid) {
        j = nullptr;
        return;
    }
    j = json{{"price", quote.price}, {"amount", quote.qty}};
}

void to_json(json& j, const BookSnapshot& snap)
{
    // per-order entries omit the symbol, it is carried once at the top level
    auto levels = [](const std::vector<Order>& orders) {
        json out = json::array();
        for (const auto& o : orders) {
            out.push_back(json{{"order_id", o.id}, {"price", o.price}, {"amount", o.amount}});
        }
        return out;
    };

    j = json{
        {"symbol",      snap.symbol},
        {"buy_orders",  levels(snap.bids)},
        {"sell_orders", levels(snap.asks)},
    };
}

std::string format_utc_ms(std::int64_t epoch_ms)
{
    std::int64_t secs = epoch_ms / 1000;
    std::int64_t ms   = epoch_ms % 1000;
    if (ms < 0) {
        ms += 1000;
        --secs;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

std::int64_t parse_utc_ms(const std::string& text)
{
    std::tm tm{};
    int ms = 0;
    char tail = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d%c",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &ms, &tail);
    if (n != 8 || tail != 'Z') {
        throw std::runtime_error("invalid UTC timestamp: " + text);
    }

    tm.tm_year -= 1900;
    tm.tm_mon  -= 1;

    std::time_t secs = timegm(&tm);
    return static_cast<std::int64_t>(secs) * 1000 + ms;
}

} // namespace oms
