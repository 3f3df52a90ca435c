#include "oms/config.hpp"

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using nlohmann::json;

namespace oms {

OmsConfig config_from_json(const json& j)
{
    if (!j.is_object()) {
        throw std::runtime_error("config must be a JSON object, got: " + j.dump());
    }

    OmsConfig cfg;
    std::int64_t max_symbol_length = static_cast<std::int64_t>(cfg.max_symbol_length);
    try {
        cfg.max_amount             = j.value("max_amount", cfg.max_amount);
        cfg.max_price              = j.value("max_price", cfg.max_price);
        max_symbol_length          = j.value("max_symbol_length", max_symbol_length);
        cfg.uppercase_symbols_only = j.value("uppercase_symbols_only", cfg.uppercase_symbols_only);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid config: ") + e.what());
    }

    if (cfg.max_amount <= 0) {
        throw std::runtime_error("max_amount must be positive");
    }
    if (cfg.max_price < 0) {
        throw std::runtime_error("max_price must not be negative");
    }
    if (max_symbol_length <= 0) {
        throw std::runtime_error("max_symbol_length must be positive");
    }
    cfg.max_symbol_length = static_cast<std::size_t>(max_symbol_length);

    return cfg;
}

OmsConfig load_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open config: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
    }

    return config_from_json(j);
}

bool is_valid_symbol(const std::string& symbol, const OmsConfig& config) noexcept
{
    if (symbol.empty() || symbol.size() > config.max_symbol_length) {
        return false;
    }
    if (!config.uppercase_symbols_only) {
        return true;
    }
    for (char c : symbol) {
        if (c < 'A' || c > 'Z') {
            return false;
        }
    }
    return true;
}

std::string symbol_for_index(std::size_t idx, const std::string& prefix)
{
    std::string digits;
    do {
        digits.insert(digits.begin(), static_cast<char>('A' + idx % 26));
        idx /= 26;
    } while (idx > 0);
    return prefix + digits;
}

} // namespace oms
