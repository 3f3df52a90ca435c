#include "oms/types.hpp"
#include "oms/errors.hpp"

#include <cctype>

namespace oms {

const char* to_string(Side side) noexcept
{
    return side == Side::Buy ? "BUY" : "SELL";
}

std::optional<Side> parse_side(std::string_view token)
{
    std::string up;
    up.reserve(token.size());
    for (char c : token) {
        up.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (up == "BUY" || up == "B")  return Side::Buy;
    if (up == "SELL" || up == "S") return Side::Sell;
    return std::nullopt;
}

const char* to_string(ErrorKind kind) noexcept
{
    switch (kind) {
    case ErrorKind::InvalidOrder:          return "InvalidOrder";
    case ErrorKind::DuplicateOrder:        return "DuplicateOrder";
    case ErrorKind::NotFound:              return "NotFound";
    case ErrorKind::UnknownSymbol:         return "UnknownSymbol";
    case ErrorKind::InvalidRequest:        return "InvalidRequest";
    case ErrorKind::InsufficientLiquidity: return "InsufficientLiquidity";
    }
    return "Unknown";
}

} // namespace oms
