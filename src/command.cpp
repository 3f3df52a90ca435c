#include "oms/command.hpp"

#include <cctype>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace oms {
namespace {

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string to_upper(std::string s)
{
    for (auto& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

std::vector<std::string> split_csv(const std::string& line)
{
    std::vector<std::string> tokens;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        tokens.push_back(trim(token));
    }
    return tokens;
}

// whole-token integer parsing: "12abc" is rejected
template <typename T>
T parse_int(const std::string& token)
{
    std::size_t pos = 0;
    long long v = std::stoll(token, &pos);
    if (pos != token.size()) {
        throw std::invalid_argument("trailing characters in " + token);
    }
    return static_cast<T>(v);
}

} // namespace

bool is_comment_or_empty(const std::string& line)
{
    auto t = trim(line);
    return t.empty() || t[0] == '#';
}

std::optional<Command> parse_command(const std::string& line)
{
    if (is_comment_or_empty(line)) {
        return std::nullopt;
    }

    auto tokens = split_csv(line);
    const auto type_str = to_upper(tokens.at(0));

    Command cmd;

    try {
        if (type_str == "ADD") {
            if (tokens.size() != 6) return std::nullopt;

            auto side = parse_side(tokens[3]);
            if (!side) return std::nullopt;

            cmd.type   = CommandType::Add;
            cmd.id     = parse_int<OrderId>(tokens[1]);
            cmd.symbol = tokens[2];
            cmd.side   = *side;
            cmd.amount = parse_int<Quantity>(tokens[4]);
            cmd.price  = parse_int<Price>(tokens[5]);
            return cmd;
        } else if (type_str == "REMOVE" || type_str == "CANCEL") {
            if (tokens.size() != 2) return std::nullopt;

            cmd.type = CommandType::Remove;
            cmd.id   = parse_int<OrderId>(tokens[1]);
            return cmd;
        } else if (type_str == "PRICE" || type_str == "TRADE") {
            if (tokens.size() != 4) return std::nullopt;

            auto side = parse_side(tokens[2]);
            if (!side) return std::nullopt;

            cmd.type   = type_str == "PRICE" ? CommandType::Price : CommandType::Trade;
            cmd.symbol = tokens[1];
            cmd.side   = *side;
            cmd.amount = parse_int<Quantity>(tokens[3]);
            return cmd;
        } else if (type_str == "BOOK") {
            if (tokens.size() != 2) return std::nullopt;

            cmd.type   = CommandType::Book;
            cmd.symbol = tokens[1];
            return cmd;
        }
    } catch (const std::exception&) {
        // std::stoll failures: invalid_argument / out_of_range
        return std::nullopt;
    }

    return std::nullopt;
}

std::string format_command(const Command& cmd)
{
    std::ostringstream out;
    switch (cmd.type) {
    case CommandType::Add:
        out << "ADD," << cmd.id << "," << cmd.symbol << "," << to_string(cmd.side)
            << "," << cmd.amount << "," << cmd.price;
        break;
    case CommandType::Remove:
        out << "REMOVE," << cmd.id;
        break;
    case CommandType::Price:
        out << "PRICE," << cmd.symbol << "," << to_string(cmd.side) << "," << cmd.amount;
        break;
    case CommandType::Trade:
        out << "TRADE," << cmd.symbol << "," << to_string(cmd.side) << "," << cmd.amount;
        break;
    case CommandType::Book:
        out << "BOOK," << cmd.symbol;
        break;
    }
    return out.str();
}

} // namespace oms
