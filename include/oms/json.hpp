#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "oms/types.hpp"

namespace oms {

// nlohmann_json hooks (found by ADL). Field names follow the order
// management wire format: order_id, symbol, side, amount, price,
// filled_amount, fill_price, trade_id, total_price, executed_at,
// order_fills, buy_orders, sell_orders.
//
// from_json throws std::runtime_error on an unknown side and
// nlohmann::json::exception on missing or mistyped fields.

void to_json(nlohmann::json& j, Side side);
void from_json(const nlohmann::json& j, Side& side);

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const OrderFill& fill);
void from_json(const nlohmann::json& j, OrderFill& fill);

void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);

void to_json(nlohmann::json& j, const BestQuote& quote);

void to_json(nlohmann::json& j, const BookSnapshot& snap);

/// "2026-01-31T12:00:00.250Z" style UTC timestamp.
std::string format_utc_ms(std::int64_t epoch_ms);

/// Inverse of format_utc_ms. Throws std::runtime_error on malformed input.
std::int64_t parse_utc_ms(const std::string& text);

} // namespace oms
