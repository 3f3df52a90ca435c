#include "oms/config.hpp"
#include "oms/errors.hpp"
#include "oms/order_book_registry.hpp"
#include "oms/order_manager.hpp"
#include "oms/types.hpp"
#include "utils/benchmark.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace oms;

using Clock       = std::chrono::steady_clock;
using Nanoseconds = std::chrono::nanoseconds;

static const std::string SHARED_SYMBOL = "SHARED";

struct WorkerStats {
    Quantity            added  = 0;
    Quantity            traded = 0;
    std::size_t         rejected = 0;   // InsufficientLiquidity on the shared book
    std::size_t         errors   = 0;   // any other oms::Error
    std::vector<double> latencies_ns;
};

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: oms_mt_bench <num_threads> <ops_per_thread> [shared_percent]\n";
        return 1;
    }

    const std::size_t num_threads    = static_cast<std::size_t>(std::stoull(argv[1]));
    const std::size_t ops_per_thread = static_cast<std::size_t>(std::stoull(argv[2]));
    const int shared_percent         = (argc > 3) ? std::stoi(argv[3]) : 10;

    if (num_threads == 0 || ops_per_thread == 0) {
        std::cerr << "num_threads and ops_per_thread must be > 0\n";
        return 1;
    }

    OrderBookRegistry registry;
    OrderManager      om(registry);

    std::vector<WorkerStats> stats(num_threads);
    std::atomic<bool> start{false};

    std::vector<std::thread> workers;
    workers.reserve(num_threads);

    for (std::size_t t = 0; t < num_threads; ++t) {
        workers.emplace_back([&, t]() {
            WorkerStats& st = stats[t];
            st.latencies_ns.reserve(ops_per_thread);

            std::mt19937_64 rng(1000 + t);
            std::uniform_int_distribution<int> pct_dist(0, 99);
            std::uniform_int_distribution<Price> price_dist(95, 105);
            std::uniform_int_distribution<Quantity> qty_dist(1, 10);

            const std::string symbol = symbol_for_index(t, "T");
            OrderId next_id = static_cast<OrderId>(t) * 1'000'000'000ULL + 1;

            while (!start.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }

            for (std::size_t i = 0; i < ops_per_thread; ++i) {
                const bool shared = pct_dist(rng) < shared_percent;
                const std::string& sym = shared ? SHARED_SYMBOL : symbol;
                const Quantity qty = qty_dist(rng);

                auto t0 = Clock::now();
                try {
                    if (i % 2 == 0) {
                        om.add_order(next_id++, sym, Side::Sell, qty, price_dist(rng));
                        st.added += qty;
                    } else {
                        Trade trade = om.place_trade(sym, Side::Buy, qty);
                        st.traded += trade.amount;
                    }
                } catch (const InsufficientLiquidity&) {
                    ++st.rejected;
                } catch (const UnknownSymbol&) {
                    // shared book not created yet by any thread
                    ++st.rejected;
                } catch (const Error& e) {
                    if (st.errors++ == 0) {
                        std::cerr << "[mt_bench] thread " << t << ": " << e.what() << "\n";
                    }
                }
                auto t1 = Clock::now();

                st.latencies_ns.push_back(bench::elapsed_ns(t0, t1));
            }
        });
    }

    auto start_time = Clock::now();
    start.store(true, std::memory_order_release);
    for (auto& w : workers) {
        w.join();
    }
    auto end_time = Clock::now();

    Quantity added = 0, traded = 0;
    std::size_t rejected = 0, errors = 0;
    std::vector<double> all;
    for (auto& st : stats) {
        added    += st.added;
        traded   += st.traded;
        rejected += st.rejected;
        errors   += st.errors;
        all.insert(all.end(), st.latencies_ns.begin(), st.latencies_ns.end());
    }

    const auto ns = std::chrono::duration_cast<Nanoseconds>(end_time - start_time).count();
    const double seconds = static_cast<double>(ns) / 1e9;
    const std::size_t processed = all.size();

    std::cout << "mt_bench: " << num_threads << " threads, processed " << processed
              << " ops in " << seconds << " s\n";
    if (seconds > 0.0) {
        std::cout << "  throughput: " << static_cast<double>(processed) / seconds << " ops/s\n";
    }

    auto lat = bench::summarize(all);
    std::cout << "Latency per call:\n";
    std::cout << "  mean: " << lat.mean << " ns\n";
    std::cout << "  p50:  " << lat.p50 << " ns\n";
    std::cout << "  p95:  " << lat.p95 << " ns\n";
    std::cout << "  p99:  " << lat.p99 << " ns\n";
    std::cout << "  max:  " << lat.max << " ns\n";

    Quantity resting = 0;
    for (const auto& symbol : registry.symbols()) {
        for (const auto& o : om.snapshot(symbol).asks) {
            resting += o.amount;
        }
    }

    std::cout << "Volume: added=" << added << ", traded=" << traded
              << ", resting=" << resting << ", rejected trades=" << rejected << ", errors=" << errors << "\n";

    if (added - traded != resting) {
        std::cerr << "[mt_bench] conservation violated: added - traded = "
                  << (added - traded) << " but resting = " << resting << "\n";
        return 1;
    }
    std::cout << "Conservation check: ok\n";
    return 0;
}
