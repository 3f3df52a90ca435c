#include "oms/command.hpp"
#include "oms/config.hpp"
#include "oms/types.hpp"

#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace oms;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: oms_generate <num_commands> <seed> [num_symbols]\n";
        return 1;
    }

    const std::size_t num_commands = static_cast<std::size_t>(std::stoull(argv[1]));
    const std::uint32_t seed       = static_cast<std::uint32_t>(std::stoul(argv[2]));
    const std::size_t num_symbols  = (argc > 3) ? std::stoull(argv[3]) : 3;

    if (num_symbols == 0) {
        std::cerr << "num_symbols must be > 0\n";
        return 1;
    }

    std::vector<std::string> symbols;
    for (std::size_t i = 0; i < num_symbols; ++i) {
        symbols.push_back(symbol_for_index(i, "S"));
    }

    std::mt19937_64 rng(seed);

    // Command mix:
    // 0..54  -> ADD (55%)
    // 55..69 -> PRICE (15%)
    // 70..89 -> TRADE (20%)
    // 90..97 -> REMOVE (8%)
    // 98..99 -> BOOK (2%)
    std::uniform_int_distribution<int> type_dist(0, 99);
    std::uniform_int_distribution<int> side_dist(0, 1);
    std::uniform_int_distribution<std::size_t> symbol_dist(0, num_symbols - 1);
    std::uniform_int_distribution<Price> price_dist(95, 105);
    std::uniform_int_distribution<Quantity> qty_dist(1, 10);

    std::vector<OrderId> active_ids;
    active_ids.reserve(num_commands);

    OrderId next_id = 1;

    // header comment, skipped by oms_replay
    std::cout << "# ADD,id,symbol,side,amount,price | REMOVE,id | PRICE|TRADE,symbol,side,amount | BOOK,symbol\n";

    for (std::size_t i = 0; i < num_commands; ++i) {
        int r = type_dist(rng);

        Command cmd;
        cmd.symbol = symbols[symbol_dist(rng)];
        cmd.side   = (side_dist(rng) == 0) ? Side::Buy : Side::Sell;

        // no resting ids yet: REMOVE would only produce NotFound noise
        bool force_add = active_ids.empty();

        if (force_add || r < 55) {
            cmd.type   = CommandType::Add;
            cmd.id     = next_id++;
            cmd.amount = qty_dist(rng);
            cmd.price  = price_dist(rng);
            active_ids.push_back(cmd.id);
        } else if (r < 70) {
            cmd.type   = CommandType::Price;
            cmd.amount = qty_dist(rng);
        } else if (r < 90) {
            cmd.type   = CommandType::Trade;
            cmd.amount = qty_dist(rng);
        } else if (r < 98) {
            // may already be consumed by a trade; replay reports NotFound then
            std::uniform_int_distribution<std::size_t> idx_dist(0, active_ids.size() - 1);
            std::size_t idx = idx_dist(rng);

            cmd.type = CommandType::Remove;
            cmd.id   = active_ids[idx];

            active_ids[idx] = active_ids.back();
            active_ids.pop_back();
        } else {
            cmd.type = CommandType::Book;
        }

        std::cout << format_command(cmd) << "\n";
    }

    return 0;
}
