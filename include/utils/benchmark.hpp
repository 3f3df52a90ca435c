#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

namespace bench {

using Clock = std::chrono::steady_clock;

inline double elapsed_ns(Clock::time_point start, Clock::time_point end) noexcept
{
    return static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
}

struct Percentiles {
    double mean = 0.0;
    double p50  = 0.0;
    double p95  = 0.0;
    double p99  = 0.0;
    double max  = 0.0;
};

// Sorts samples in place.
inline Percentiles summarize(std::vector<double>& samples)
{
    Percentiles out;
    if (samples.empty()) {
        return out;
    }

    std::sort(samples.begin(), samples.end());
    const std::size_t n = samples.size();

    auto pick = [&](double p) {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(n - 1) + 0.5);
        return samples[std::min(idx, n - 1)];
    };

    out.mean = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(n);
    out.p50  = pick(0.50);
    out.p95  = pick(0.95);
    out.p99  = pick(0.99);
    out.max  = samples.back();
    return out;
}

struct Result {
    std::string name;
    Percentiles ns_per_op;
    std::size_t iterations = 0;
    std::size_t runs       = 1;
    std::size_t batch_size = 1;
};

// Times fn(i) for i in [warmup, iterations) in batches of batch_size and
// reports ns/op per batch; fn(i) for i < warmup runs untimed.
template <typename F>
Result run_batched(std::string_view name,
                   std::size_t      iterations,
                   std::size_t      batch_size,
                   F&&              fn,
                   std::size_t      warmup = 0)
{
    Result res;
    res.name       = std::string(name);
    res.iterations = iterations;
    res.batch_size = std::max<std::size_t>(batch_size, 1);

    warmup = std::min(warmup, iterations);
    for (std::size_t i = 0; i < warmup; ++i) {
        fn(i);
    }

    std::vector<double> samples;
    samples.reserve((iterations - warmup) / res.batch_size + 1);

    for (std::size_t i = warmup; i < iterations;) {
        const std::size_t end = std::min(iterations, i + res.batch_size);

        auto t0 = Clock::now();
        for (std::size_t j = i; j < end; ++j) {
            fn(j);
        }
        auto t1 = Clock::now();

        samples.push_back(elapsed_ns(t0, t1) / static_cast<double>(end - i));
        i = end;
    }

    res.ns_per_op = summarize(samples);
    return res;
}

// Averages `runs` independent results; make_run(run_idx) builds fresh state
// and returns one run_batched() result.
template <typename F>
Result run_multi(std::string_view name, std::size_t runs, F&& make_run)
{
    Result agg;
    agg.name = std::string(name);
    agg.runs = runs;
    if (runs == 0) {
        return agg;
    }

    for (std::size_t r = 0; r < runs; ++r) {
        Result one = make_run(r);
        agg.iterations = one.iterations;
        agg.batch_size = one.batch_size;
        agg.ns_per_op.mean += one.ns_per_op.mean;
        agg.ns_per_op.p50  += one.ns_per_op.p50;
        agg.ns_per_op.p95  += one.ns_per_op.p95;
        agg.ns_per_op.p99  += one.ns_per_op.p99;
        agg.ns_per_op.max   = std::max(agg.ns_per_op.max, one.ns_per_op.max);
    }

    const double inv = 1.0 / static_cast<double>(runs);
    agg.ns_per_op.mean *= inv;
    agg.ns_per_op.p50  *= inv;
    agg.ns_per_op.p95  *= inv;
    agg.ns_per_op.p99  *= inv;
    return agg;
}

inline void print(const Result& r)
{
    std::cout << "[bench] " << r.name
              << " (runs=" << r.runs
              << ", iters=" << r.iterations
              << ", batch=" << r.batch_size << "):\n";

    if (r.iterations == 0) {
        std::cout << "  no iterations\n";
        return;
    }

    std::cout << "  mean ns/op: " << r.ns_per_op.mean;
    if (r.ns_per_op.mean > 0.0) {
        std::cout << ", " << 1e3 / r.ns_per_op.mean << " Mops/s";
    }
    std::cout << "\n";
    std::cout << "  p50 ns:     " << r.ns_per_op.p50 << "\n";
    std::cout << "  p95 ns:     " << r.ns_per_op.p95 << "\n";
    std::cout << "  p99 ns:     " << r.ns_per_op.p99 << "\n";
    std::cout << "  max ns:     " << r.ns_per_op.max << "\n";
}

} // namespace bench
