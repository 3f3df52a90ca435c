#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "oms/types.hpp"

namespace oms {

enum class CommandType : std::uint8_t {
    Add,
    Remove,
    Price,
    Trade,
    Book
};

// One line of a command script, fed to OrderManager by the replay tool.
//
//   ADD,id,symbol,side,amount,price
//   REMOVE,id                 (alias CANCEL)
//   PRICE,symbol,side,amount
//   TRADE,symbol,side,amount
//   BOOK,symbol
struct Command {
    CommandType type   = CommandType::Add;
    OrderId     id     = 0;   // Add, Remove
    std::string symbol;       // all but Remove
    Side        side   = Side::Buy;
    Quantity    amount = 0;   // Add, Price, Trade
    Price       price  = 0;   // Add
};

/// Blank lines and lines starting with '#'.
bool is_comment_or_empty(const std::string& line);

/// nullopt for comments and for lines that do not parse.
std::optional<Command> parse_command(const std::string& line);

/// CSV form accepted by parse_command.
std::string format_command(const Command& cmd);

} // namespace oms
