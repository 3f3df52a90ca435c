#include "oms/command.hpp"
#include "oms/config.hpp"
#include "oms/errors.hpp"
#include "oms/json.hpp"
#include "oms/order_book_registry.hpp"
#include "oms/order_manager.hpp"
#include "oms/types.hpp"

#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

using namespace oms;
using nlohmann::json;

// --------- stats struct ---------

struct ReplayStats {
    std::size_t add_count    = 0;
    std::size_t remove_count = 0;
    std::size_t price_count  = 0;
    std::size_t trade_count  = 0;
    std::size_t book_count   = 0;
    std::size_t skipped      = 0;

    std::map<ErrorKind, std::size_t> errors;

    Quantity total_added_buy  = 0;
    Quantity total_added_sell = 0;

    Quantity traded_buy  = 0;   // filled for BUY requests
    Quantity traded_sell = 0;   // filled for SELL requests

    Price notional_buy  = 0;    // sum of total_price of BUY trades
    Price notional_sell = 0;
};

static const char* command_name(CommandType type) {
    switch (type) {
    case CommandType::Add:    return "ADD";
    case CommandType::Remove: return "REMOVE";
    case CommandType::Price:  return "PRICE";
    case CommandType::Trade:  return "TRADE";
    case CommandType::Book:   return "BOOK";
    }
    return "?";
}

static json run_command(OrderManager& om, const Command& cmd, ReplayStats& stats) {
    switch (cmd.type) {
    case CommandType::Add: {
        ++stats.add_count;
        om.add_order(cmd.id, cmd.symbol, cmd.side, cmd.amount, cmd.price);
        if (cmd.side == Side::Buy) {
            stats.total_added_buy += cmd.amount;
        } else {
            stats.total_added_sell += cmd.amount;
        }
        return om.get_order(cmd.id);
    }
    case CommandType::Remove: {
        ++stats.remove_count;
        om.remove_order(cmd.id);
        return json{{"order_id", cmd.id}};
    }
    case CommandType::Price: {
        ++stats.price_count;
        return json{{"price", om.calculate_price(cmd.symbol, cmd.side, cmd.amount)}};
    }
    case CommandType::Trade: {
        ++stats.trade_count;
        Trade trade = om.place_trade(cmd.symbol, cmd.side, cmd.amount);
        if (trade.side == Side::Buy) {
            stats.traded_buy   += trade.amount;
            stats.notional_buy += trade.total_price;
        } else {
            stats.traded_sell   += trade.amount;
            stats.notional_sell += trade.total_price;
        }
        return trade;
    }
    case CommandType::Book: {
        ++stats.book_count;
        return om.snapshot(cmd.symbol);
    }
    }
    return nullptr;
}

static void print_vwap(const char* label, Price notional, Quantity filled) {
    std::cout << "  " << label << " VWAP: ";
    if (filled > 0) {
        double vwap = static_cast<double>(notional) / static_cast<double>(filled);
        std::cout << std::fixed << std::setprecision(2) << vwap << "\n";
    } else {
        std::cout << "n/a\n";
    }
}

static void print_stats(const ReplayStats& st, const OrderManager& om,
                        const OrderBookRegistry& registry) {
    std::cout << "\n=== Replay summary ===\n\n";

    std::cout << "Commands:\n";
    std::cout << "  ADD    : " << st.add_count    << "\n";
    std::cout << "  REMOVE : " << st.remove_count << "\n";
    std::cout << "  PRICE  : " << st.price_count  << "\n";
    std::cout << "  TRADE  : " << st.trade_count  << "\n";
    std::cout << "  BOOK   : " << st.book_count   << "\n";
    std::cout << "  skipped: " << st.skipped      << "\n\n";

    std::cout << "Rejected:\n";
    if (st.errors.empty()) {
        std::cout << "  none\n";
    }
    for (const auto& [kind, count] : st.errors) {
        std::cout << "  " << std::left << std::setw(22) << to_string(kind)
                  << ": " << count << "\n";
    }
    std::cout << "\n";

    std::cout << "Added volume:\n";
    std::cout << "  Buy  : " << st.total_added_buy  << "\n";
    std::cout << "  Sell : " << st.total_added_sell << "\n\n";

    std::cout << "Traded volume:\n";
    std::cout << "  Buy  : " << st.traded_buy  << "\n";
    std::cout << "  Sell : " << st.traded_sell << "\n";
    print_vwap("Buy ", st.notional_buy, st.traded_buy);
    print_vwap("Sell", st.notional_sell, st.traded_sell);
    std::cout << "\n";

    std::cout << "Books: " << registry.book_count()
              << ", resting orders: " << registry.order_count() << "\n";
    for (const auto& symbol : registry.symbols()) {
        auto bb = om.best_quote(symbol, Side::Buy);
        auto ba = om.best_quote(symbol, Side::Sell);

        std::cout << "  " << symbol << ": bid ";
        if (bb.valid) {
            std::cout << bb.price << " x " << bb.qty;
        } else {
            std::cout << "none";
        }
        std::cout << ", ask ";
        if (ba.valid) {
            std::cout << ba.price << " x " << ba.qty;
        } else {
            std::cout << "none";
        }
        std::cout << "\n";
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: oms_replay <commands_file> [config.json]\n";
        return 1;
    }

    const char* path = argv[1];
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[replay] Failed to open: " << path << "\n";
        return 1;
    }

    OmsConfig config;
    if (argc > 2) {
        try {
            config = load_config(argv[2]);
        } catch (const std::exception& e) {
            std::cerr << "[replay] " << e.what() << "\n";
            return 1;
        }
    }

    OrderBookRegistry registry;
    OrderManager      om(registry, config);
    ReplayStats       stats;

    std::string line;
    std::size_t line_no = 0;

    try {
        while (std::getline(in, line)) {
            ++line_no;
            if (is_comment_or_empty(line)) {
                continue;
            }

            auto cmd = parse_command(line);
            if (!cmd) {
                ++stats.skipped;
                std::cerr << "[replay] Skipping line " << line_no << ": " << line << "\n";
                continue;
            }

            json out = {{"line", line_no}, {"command", command_name(cmd->type)}};
            try {
                out["ok"]     = true;
                out["result"] = run_command(om, *cmd, stats);
            } catch (const Error& e) {
                ++stats.errors[e.kind()];
                out["ok"]      = false;
                out["error"]   = to_string(e.kind());
                out["message"] = e.what();
            }
            std::cout << out.dump() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[replay] Fatal error at line " << line_no << ": " << e.what() << "\n";
        return 1;
    }

    print_stats(stats, om, registry);
    return 0;
}
