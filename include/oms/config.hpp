#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "oms/types.hpp"

namespace oms {

/// Admission limits applied by OrderManager before anything reaches a book.
struct OmsConfig {
    Quantity    max_amount             = 10'000'000;
    Price       max_price              = 10'000'000;   // cents
    std::size_t max_symbol_length      = 10;
    bool        uppercase_symbols_only = true;          // symbols match [A-Z]+
};

/// Keys missing from j keep their defaults.
/// Throws std::runtime_error on wrong types or out-of-range values.
OmsConfig config_from_json(const nlohmann::json& j);

/// Read a JSON config file, e.g. {"max_amount": 1000, "max_symbol_length": 6}.
OmsConfig load_config(const std::string& path);

/// True if symbol is acceptable under config.
bool is_valid_symbol(const std::string& symbol, const OmsConfig& config) noexcept;

/// Letters-only symbol for tools that synthesize books: prefix followed by idx
/// in base 26 ("A".."Z", "BA", ...).
std::string symbol_for_index(std::size_t idx, const std::string& prefix);

} // namespace oms
