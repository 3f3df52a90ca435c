#include "oms/order_book.hpp"
#include "oms/order_book_registry.hpp"
#include "oms/order_manager.hpp"
#include "oms/price_calculator.hpp"
#include "oms/trade_executor.hpp"
#include "oms/types.hpp"
#include "utils/benchmark.hpp"

#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace oms;

struct OrderParams {
    Side     side;
    Price    price;
    Quantity qty;
};

struct RequestParams {
    Side     side;
    Quantity qty;
};

static Order make_order(OrderId id, const OrderParams& p) {
    Order o;
    o.id     = id;
    o.symbol = "BENCH";
    o.side   = p.side;
    o.amount = p.qty;
    o.price  = p.price;
    return o;
}

int main(int argc, char** argv) {
    std::size_t iterations = (argc > 1) ? std::stoull(argv[1]) : 200'000;
    std::size_t runs       = (argc > 2) ? std::stoull(argv[2]) : 5;
    std::size_t batch_size = (argc > 3) ? std::stoull(argv[3]) : 128;

    if (iterations == 0) {
        std::cerr << "iterations must be > 0\n";
        return 1;
    }
    if (runs == 0) {
        std::cerr << "runs must be > 0\n";
        return 1;
    }

    std::size_t warmup = iterations / 10;

    std::cout << "Config:\n"
              << "  iterations = " << iterations << "\n"
              << "  runs       = " << runs << "\n"
              << "  batch_size = " << batch_size << "\n"
              << "  warmup     = " << warmup << "\n\n";

    std::mt19937_64 rng(42);
    std::uniform_int_distribution<int> side_dist(0, 1);
    std::uniform_int_distribution<Price> price_dist(95, 105);
    std::uniform_int_distribution<Quantity> qty_dist(1, 10);

    // pre-generated so that the RNG stays out of the measurement
    auto gen_orders = [&](std::size_t n) {
        std::vector<OrderParams> out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            Side side = (side_dist(rng) == 0) ? Side::Buy : Side::Sell;
            out.push_back(OrderParams{side, price_dist(rng), qty_dist(rng)});
        }
        return out;
    };

    std::vector<OrderParams> add_params = gen_orders(iterations);

    std::vector<RequestParams> req_params;
    req_params.reserve(iterations);
    for (std::size_t i = 0; i < iterations; ++i) {
        Side side = (side_dist(rng) == 0) ? Side::Buy : Side::Sell;
        req_params.push_back(RequestParams{side, qty_dist(rng)});
    }

    // initial liquidity for the pricing / trading benches
    constexpr std::size_t INIT_ORDERS = 50'000;
    std::vector<OrderParams> init_orders = gen_orders(INIT_ORDERS);

    auto fill_book = [&](OrderBook& book) {
        OrderId id = 1;
        for (const auto& p : init_orders) {
            book.insert(make_order(id++, p));
        }
        return id;
    };

    // ---------- OrderBook::insert ----------

    auto insert_summary = bench::run_multi("OrderBook::insert", runs, [&](std::size_t) {
        OrderBook book("BENCH");
        return bench::run_batched("OrderBook::insert_single", iterations, batch_size,
            [&](std::size_t i) {
                book.insert(make_order(static_cast<OrderId>(i) + 1, add_params[i]));
            },
            warmup);
    });
    bench::print(insert_summary);
    std::cout << "\n";

    // ---------- calculate_price ----------

    auto price_summary = bench::run_multi("calculate_price", runs, [&](std::size_t) {
        OrderBook book("BENCH");
        fill_book(book);

        Price sink = 0;
        auto res = bench::run_batched("calculate_price_single", iterations, batch_size,
            [&](std::size_t i) {
                const auto& p = req_params[i];
                sink += calculate_price(book, p.side, p.qty);
            },
            warmup);
        if (sink < 0) {
            std::cerr << "unexpected negative price sum\n";
        }
        return res;
    });
    bench::print(price_summary);
    std::cout << "\n";

    // ---------- execute_trade (+ refill of the consumed side) ----------

    auto trade_summary = bench::run_multi("execute_trade+refill", runs, [&](std::size_t) {
        OrderBook book("BENCH");
        OrderId next_id = fill_book(book);

        return bench::run_batched("execute_trade+refill_single", iterations, batch_size,
            [&](std::size_t i) {
                const auto& p = req_params[i];
                execute_trade(book, p.side, p.qty, std::string(), 0);
                book.insert(make_order(next_id++,
                    OrderParams{counter_side(p.side), add_params[i].price, p.qty}));
            },
            warmup);
    });
    bench::print(trade_summary);
    std::cout << "\n";

    // ---------- OrderManager::place_trade (locking + id index) ----------

    auto om_summary = bench::run_multi("OrderManager::place_trade+add", runs, [&](std::size_t) {
        OrderBookRegistry registry;
        OrderManager om(registry);

        OrderId next_id = 1;
        for (const auto& p : init_orders) {
            om.add_order(next_id++, "BENCH", p.side, p.qty, p.price);
        }

        return bench::run_batched("OrderManager::place_trade+add_single", iterations, batch_size,
            [&](std::size_t i) {
                const auto& p = req_params[i];
                om.place_trade("BENCH", p.side, p.qty);
                om.add_order(next_id++, "BENCH", counter_side(p.side), p.qty, add_params[i].price);
            },
            warmup);
    });
    bench::print(om_summary);

    return 0;
}
