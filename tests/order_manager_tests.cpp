#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "oms/config.hpp"
#include "oms/errors.hpp"
#include "oms/order_book_registry.hpp"
#include "oms/order_manager.hpp"
#include "oms/types.hpp"

using namespace oms;

namespace {

class OrderManagerTest : public ::testing::Test {
protected:
    OrderBookRegistry registry;
    OrderManager      om{registry};

    void add_jpm_asks()
    {
        om.add_order(1, "JPM", Side::Sell, 20, 20);
        om.add_order(4, "JPM", Side::Sell, 10, 21);
    }
};

template <typename Fn>
ErrorKind kind_of(Fn&& fn)
{
    try {
        fn();
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no oms::Error thrown";
    return ErrorKind::InvalidRequest;
}

} // namespace

TEST(OrderBookRegistryTest, CreatesBooksLazily) {
    OrderBookRegistry registry;
    EXPECT_EQ(registry.find("JPM"), nullptr);
    EXPECT_EQ(registry.book_count(), 0u);

    auto& slot = registry.get_or_create("JPM");
    EXPECT_EQ(slot.book.symbol(), "JPM");
    EXPECT_EQ(registry.find("JPM"), &slot);
    EXPECT_EQ(&registry.get_or_create("JPM"), &slot);

    registry.get_or_create("GOOG");
    EXPECT_EQ(registry.symbols(), (std::vector<std::string>{"GOOG", "JPM"}));
}

TEST(OrderBookRegistryTest, OrderIdsAreClaimedOnce) {
    OrderBookRegistry registry;
    EXPECT_TRUE(registry.claim_order(1, "JPM"));
    EXPECT_FALSE(registry.claim_order(1, "GOOG"));
    EXPECT_EQ(registry.symbol_of(1).value(), "JPM");
    EXPECT_EQ(registry.order_count(), 1u);

    registry.release_order(1);
    EXPECT_FALSE(registry.symbol_of(1).has_value());
    EXPECT_TRUE(registry.claim_order(1, "GOOG"));
}

TEST_F(OrderManagerTest, WorkedPriceExamples) {
    add_jpm_asks();

    EXPECT_EQ(om.calculate_price("JPM", Side::Buy, 20), 400);
    EXPECT_EQ(om.calculate_price("JPM", Side::Buy, 10), 200);
    EXPECT_EQ(om.calculate_price("JPM", Side::Buy, 22), 442);
}

TEST_F(OrderManagerTest, RemoveOrderExcludesItFromPricing) {
    add_jpm_asks();

    om.remove_order(1);

    EXPECT_EQ(om.calculate_price("JPM", Side::Buy, 10), 210);
    EXPECT_EQ(kind_of([&] { om.get_order(1); }), ErrorKind::NotFound);
}

TEST_F(OrderManagerTest, PlaceTradeUpdatesBookAndIndex) {
    add_jpm_asks();

    Trade t = om.place_trade("JPM", Side::Buy, 22);

    EXPECT_EQ(t.amount, 22);
    EXPECT_EQ(t.total_price, 442);
    EXPECT_EQ(t.fills.size(), 2u);
    EXPECT_FALSE(t.trade_id.empty());
    EXPECT_GT(t.executed_at_ms, 0);

    EXPECT_EQ(om.calculate_price("JPM", Side::Buy, 8), 168);
    EXPECT_EQ(om.get_order(4).amount, 8);

    // fully consumed order 1 is gone system-wide, its id is free again
    EXPECT_EQ(kind_of([&] { om.remove_order(1); }), ErrorKind::NotFound);
    om.add_order(1, "GOOG", Side::Buy, 5, 100);
    EXPECT_EQ(om.get_order(1).symbol, "GOOG");
}

TEST_F(OrderManagerTest, TradeIdsAreUnique) {
    om.add_order(1, "JPM", Side::Sell, 10, 20);

    Trade a = om.place_trade("JPM", Side::Buy, 1);
    Trade b = om.place_trade("JPM", Side::Buy, 1);
    EXPECT_NE(a.trade_id, b.trade_id);
}

TEST_F(OrderManagerTest, AddOrderValidation) {
    EXPECT_EQ(kind_of([&] { om.add_order(1, "JPM", Side::Buy, 0, 10); }), ErrorKind::InvalidOrder);
    EXPECT_EQ(kind_of([&] { om.add_order(1, "JPM", Side::Buy, -1, 10); }), ErrorKind::InvalidOrder);
    EXPECT_EQ(kind_of([&] { om.add_order(1, "JPM", Side::Buy, 5, -1); }), ErrorKind::InvalidOrder);
    EXPECT_EQ(kind_of([&] { om.add_order(1, "JPM", Side::Buy, 10'000'001, 10); }), ErrorKind::InvalidOrder);
    EXPECT_EQ(kind_of([&] { om.add_order(1, "JPM", Side::Buy, 5, 10'000'001); }), ErrorKind::InvalidOrder);
    EXPECT_EQ(kind_of([&] { om.add_order(1, "", Side::Buy, 5, 10); }), ErrorKind::InvalidOrder);
    EXPECT_EQ(kind_of([&] { om.add_order(1, "jpm", Side::Buy, 5, 10); }), ErrorKind::InvalidOrder);
    EXPECT_EQ(kind_of([&] { om.add_order(1, "TOOLONGSYMBOL", Side::Buy, 5, 10); }), ErrorKind::InvalidOrder);

    // rejected orders neither reserve the id nor create a book
    EXPECT_EQ(registry.order_count(), 0u);
    EXPECT_EQ(registry.book_count(), 0u);
    om.add_order(1, "JPM", Side::Buy, 5, 0);
    EXPECT_EQ(om.get_order(1).price, 0);
}

TEST_F(OrderManagerTest, DuplicateIdAcrossSymbols) {
    om.add_order(1, "JPM", Side::Buy, 20, 20);

    EXPECT_EQ(kind_of([&] { om.add_order(1, "JPM", Side::Buy, 50, 25); }), ErrorKind::DuplicateOrder);
    EXPECT_EQ(kind_of([&] { om.add_order(1, "GOOG", Side::Sell, 5, 30); }), ErrorKind::DuplicateOrder);

    EXPECT_EQ(om.get_order(1).amount, 20);
    EXPECT_TRUE(om.snapshot("GOOG").asks.empty());
}

TEST_F(OrderManagerTest, RemoveUnknownOrderIsNotFound) {
    EXPECT_EQ(kind_of([&] { om.remove_order(999); }), ErrorKind::NotFound);
}

TEST_F(OrderManagerTest, UnknownSymbol) {
    EXPECT_EQ(kind_of([&] { om.calculate_price("UNKNOWN", Side::Buy, 100); }), ErrorKind::UnknownSymbol);
    EXPECT_EQ(kind_of([&] { om.place_trade("UNKNOWN", Side::Buy, 100); }), ErrorKind::UnknownSymbol);
    EXPECT_EQ(registry.book_count(), 0u);
}

TEST_F(OrderManagerTest, NonPositiveRequestAmount) {
    add_jpm_asks();

    EXPECT_EQ(kind_of([&] { om.calculate_price("JPM", Side::Buy, 0); }), ErrorKind::InvalidRequest);
    EXPECT_EQ(kind_of([&] { om.place_trade("JPM", Side::Buy, -5); }), ErrorKind::InvalidRequest);
    EXPECT_EQ(kind_of([&] { om.place_trade("JPM", Side::Buy, 10'000'001); }), ErrorKind::InvalidRequest);
}

TEST_F(OrderManagerTest, InsufficientLiquidityIsAllOrNothing) {
    add_jpm_asks();

    EXPECT_EQ(kind_of([&] { om.calculate_price("JPM", Side::Buy, 50); }), ErrorKind::InsufficientLiquidity);
    EXPECT_EQ(kind_of([&] { om.place_trade("JPM", Side::Buy, 50); }), ErrorKind::InsufficientLiquidity);

    auto snap = om.snapshot("JPM");
    ASSERT_EQ(snap.asks.size(), 2u);
    EXPECT_EQ(snap.asks[0].amount, 20);
    EXPECT_EQ(snap.asks[1].amount, 10);
    EXPECT_EQ(registry.order_count(), 2u);
}

TEST_F(OrderManagerTest, BookWithOnlySameSideOrdersHasNoLiquidity) {
    om.add_order(1, "JPM", Side::Buy, 20, 20);
    EXPECT_EQ(kind_of([&] { om.place_trade("JPM", Side::Buy, 1); }), ErrorKind::InsufficientLiquidity);
}

TEST_F(OrderManagerTest, PartialConsumptionLeavesRemainder) {
    om.add_order(1, "JPM", Side::Buy, 20, 20);

    om.place_trade("JPM", Side::Sell, 5);

    EXPECT_EQ(om.calculate_price("JPM", Side::Sell, 15), 300);
    EXPECT_EQ(om.get_order(1).amount, 15);
}

TEST_F(OrderManagerTest, SnapshotAndBestQuote) {
    add_jpm_asks();
    om.add_order(2, "JPM", Side::Buy, 5, 19);

    auto snap = om.snapshot("JPM");
    EXPECT_EQ(snap.symbol, "JPM");
    ASSERT_EQ(snap.bids.size(), 1u);
    ASSERT_EQ(snap.asks.size(), 2u);
    EXPECT_EQ(snap.asks[0].id, 1u);

    auto ask = om.best_quote("JPM", Side::Sell);
    EXPECT_TRUE(ask.valid);
    EXPECT_EQ(ask.price, 20);
    EXPECT_EQ(ask.qty, 20);

    EXPECT_FALSE(om.best_quote("NONE", Side::Buy).valid);
    auto none = om.snapshot("NONE");
    EXPECT_EQ(none.symbol, "NONE");
    EXPECT_TRUE(none.bids.empty());
    EXPECT_TRUE(none.asks.empty());
}

TEST_F(OrderManagerTest, SeparateRegistriesAreIsolated) {
    OrderBookRegistry other_registry;
    OrderManager other(other_registry);

    om.add_order(1, "JPM", Side::Sell, 10, 20);
    other.add_order(1, "JPM", Side::Sell, 10, 30);

    EXPECT_EQ(om.calculate_price("JPM", Side::Buy, 10), 200);
    EXPECT_EQ(other.calculate_price("JPM", Side::Buy, 10), 300);
}

TEST(OrderManagerConfig, LimitsComeFromConfig) {
    OmsConfig cfg;
    cfg.max_amount             = 100;
    cfg.max_price              = 50;
    cfg.max_symbol_length      = 3;
    cfg.uppercase_symbols_only = false;

    OrderBookRegistry registry;
    OrderManager om(registry, cfg);

    EXPECT_THROW(om.add_order(1, "ABC", Side::Sell, 101, 10), InvalidOrder);
    EXPECT_THROW(om.add_order(1, "ABC", Side::Sell, 10, 51), InvalidOrder);
    EXPECT_THROW(om.add_order(1, "ABCD", Side::Sell, 10, 10), InvalidOrder);

    om.add_order(1, "ab1", Side::Sell, 100, 50);
    EXPECT_THROW(om.place_trade("ab1", Side::Buy, 101), InvalidRequest);
    EXPECT_EQ(om.place_trade("ab1", Side::Buy, 100).total_price, 5000);
}

TEST(OrderManagerConcurrency, SymbolsTradeIndependentlyAndConserveAmounts) {
    OrderBookRegistry registry;
    OrderManager om(registry);

    const std::vector<std::string> symbols{"AAA", "BBB", "CCC", "DDD"};
    constexpr int kOrdersPerSymbol = 200;
    constexpr Quantity kAmount     = 10;

    std::vector<std::thread> threads;
    std::atomic<Quantity> traded{0};

    for (std::size_t s = 0; s < symbols.size(); ++s) {
        threads.emplace_back([&, s] {
            const auto& sym = symbols[s];
            OrderId base = static_cast<OrderId>(s) * 100'000;
            for (int i = 0; i < kOrdersPerSymbol; ++i) {
                om.add_order(base + static_cast<OrderId>(i) + 1, sym, Side::Sell, kAmount, 10 + i % 7);
                if (i % 2 == 1) {
                    om.place_trade(sym, Side::Buy, kAmount);
                    traded += kAmount;
                }
            }
        });
    }

    // readers on a shared symbol while writers run
    om.add_order(999'999, "SHR", Side::Buy, 1'000, 5);
    std::thread reader([&] {
        for (int i = 0; i < 1000; ++i) {
            EXPECT_EQ(om.calculate_price("SHR", Side::Sell, 10), 50);
        }
    });

    for (auto& t : threads) t.join();
    reader.join();

    Quantity resting = 0;
    for (const auto& sym : symbols) {
        for (const auto& o : om.snapshot(sym).asks)
            resting += o.amount;
    }

    const Quantity added = static_cast<Quantity>(symbols.size()) * kOrdersPerSymbol * kAmount;
    EXPECT_EQ(traded.load(), added / 2);
    EXPECT_EQ(resting, added - traded.load());
}

TEST(OrderManagerConcurrency, ReadersSeeWholeMutationsOnTheSameBook) {
    OrderBookRegistry registry;
    OrderManager om(registry);

    // 1000@10 is never reached: every trade finds at least its own 10@5 first
    om.add_order(1, "HOT", Side::Sell, 1'000, 10);

    constexpr int kWriters = 4;
    constexpr int kRounds  = 500;
    std::atomic<bool> done{false};
    std::atomic<int>  bad_quotes{0};
    std::atomic<int>  quotes{0};

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w] {
            OrderId base = static_cast<OrderId>(w + 1) * 100'000;
            for (int i = 0; i < kRounds; ++i) {
                om.add_order(base + static_cast<OrderId>(i), "HOT", Side::Sell, 10, 5);
                Trade trade = om.place_trade("HOT", Side::Buy, 10);
                EXPECT_EQ(trade.total_price, 50);
            }
        });
    }

    // 15 units cost 150 with no 5-priced order, 100 with one, 75 with two or more
    std::vector<std::thread> readers;
    for (int r = 0; r < 2; ++r) {
        readers.emplace_back([&] {
            while (!done.load()) {
                Price p = om.calculate_price("HOT", Side::Buy, 15);
                if (p != 75 && p != 100 && p != 150)
                    ++bad_quotes;
                ++quotes;
            }
        });
    }

    for (auto& t : writers) t.join();
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(bad_quotes.load(), 0);
    EXPECT_GT(quotes.load(), 0);

    auto snap = om.snapshot("HOT");
    ASSERT_EQ(snap.asks.size(), 1u);
    EXPECT_EQ(snap.asks[0].id, 1u);
    EXPECT_EQ(snap.asks[0].amount, 1'000);
}

TEST(OrderManagerConcurrency, GeneratedSymbolsAreAcceptedAcrossThreads) {
    OrderBookRegistry registry;
    OrderManager om(registry);

    constexpr std::size_t kThreads = 30;   // past one base-26 digit
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            const std::string sym = symbol_for_index(t, "T");
            OrderId id = static_cast<OrderId>(t) * 1'000 + 1;
            EXPECT_NO_THROW(om.add_order(id, sym, Side::Sell, 5, 100));
            EXPECT_NO_THROW(om.place_trade(sym, Side::Buy, 5));
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(registry.book_count(), kThreads);
    EXPECT_EQ(registry.order_count(), 0u);
}
