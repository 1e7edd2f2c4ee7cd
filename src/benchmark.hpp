#pragma once
/**
 * \file benchmark.hpp
 * \brief Timing comparison of the selection strategies against the reference
 *
 * Every (size, scenario) pair is generated once from a fixed seed, each
 * strategy and the reference are timed (best of `repeats`, after one warmup
 * run) and every strategy's quartiles are checked against the reference.
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "percentile_calculator.hpp"
#include "reference.hpp"

namespace bench {

enum class scenario_t {
    random,
    ascending,
    descending,
    all_same,
    duplicates
};

inline const char* scenario_name(scenario_t s) {
    switch (s) {
        case scenario_t::random: return "random";
        case scenario_t::ascending: return "ascending";
        case scenario_t::descending: return "descending";
        case scenario_t::all_same: return "all_same";
        case scenario_t::duplicates: return "duplicates";
    }
    return "?";
}

inline const std::vector<scenario_t>& all_scenarios() {
    static const std::vector<scenario_t> s{scenario_t::random, scenario_t::ascending, scenario_t::descending,
                                           scenario_t::all_same, scenario_t::duplicates};
    return s;
}

struct options_t {
    std::vector<std::size_t> sizes;
    std::vector<scenario_t> scenarios = all_scenarios();
    std::uint64_t seed = 42;
    int repeats = 3;
};

struct row_t {
    std::size_t size;
    scenario_t scenario;
    percentile::strategy_t strategy;
    double best_ms;
    double reference_ms;
    bool matches_reference;
};

inline std::vector<double> generate(scenario_t scenario, std::size_t n, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<double> v;
    v.reserve(n);
    switch (scenario) {
        case scenario_t::random: {
            std::uniform_real_distribution<double> dist(-1000.0, 1000.0);
            for (std::size_t i = 0; i < n; ++i) v.push_back(dist(rng));
            break;
        }
        case scenario_t::ascending:
            for (std::size_t i = 0; i < n; ++i) v.push_back(static_cast<double>(i));
            break;
        case scenario_t::descending:
            for (std::size_t i = n; i > 0; --i) v.push_back(static_cast<double>(i));
            break;
        case scenario_t::all_same:
            v.assign(n, 42.0);
            break;
        case scenario_t::duplicates: {
            std::uniform_int_distribution<int> dist(1, 49);
            for (std::size_t i = 0; i < n; ++i) v.push_back(static_cast<double>(dist(rng)));
            break;
        }
    }
    return v;
}

/// |a - b| within max(1e-4, scale * 1e-9), scale being the largest magnitude involved.
inline bool close_enough(const percentile::quartiles_t& a, const percentile::quartiles_t& b) {
    const double scale = std::max({std::fabs(b.p25), std::fabs(b.p50), std::fabs(b.p75), 1.0});
    const double tol = std::max(1e-4, scale * 1e-9);
    return std::fabs(a.p25 - b.p25) <= tol && std::fabs(a.p50 - b.p50) <= tol && std::fabs(a.p75 - b.p75) <= tol;
}

template <typename Fn>
double best_time_ms(Fn&& fn, int repeats) {
    fn();  // warmup
    double best = 0.0;
    for (int i = 0; i < repeats; ++i) {
        const auto start = std::chrono::steady_clock::now();
        fn();
        const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
        if (i == 0 || elapsed.count() < best) best = elapsed.count();
    }
    return best;
}

inline std::vector<row_t> run(const options_t& opts) {
    const percentile::strategy_t strategies[] = {percentile::strategy_t::sort, percentile::strategy_t::partial,
                                                 percentile::strategy_t::quickselect};
    std::vector<row_t> rows;
    for (auto n : opts.sizes) {
        for (auto scenario : opts.scenarios) {
            const auto data = generate(scenario, n, opts.seed);
            const auto expected = percentile::reference::quartiles(data);
            percentile::quartiles_t sink{};
            const double ref_ms = best_time_ms([&] { sink = percentile::reference::quartiles(data); }, opts.repeats);
            (void)sink;

            for (auto strategy : strategies) {
                const percentile::calculator calc(strategy);
                percentile::quartiles_t got{};
                const double ms = best_time_ms([&] { got = calc.calculate_quartiles(data); }, opts.repeats);
                row_t row{n, scenario, strategy, ms, ref_ms, close_enough(got, expected)};
                spdlog::info("{:>10} {:>11} {:>12} {:>10.3f} ms  ref {:>10.3f} ms  x{:<6.2f} {}", n,
                             scenario_name(scenario), percentile::strategy_name(strategy), ms, ref_ms,
                             ms > 0.0 ? ref_ms / ms : 0.0, row.matches_reference ? "ok" : "MISMATCH");
                if (!row.matches_reference) {
                    spdlog::error("{} / {} / n={}: got ({}, {}, {}), expected ({}, {}, {})",
                                  percentile::strategy_name(strategy), scenario_name(scenario), n, got.p25,
                                  got.p50, got.p75, expected.p25, expected.p50, expected.p75);
                }
                rows.push_back(row);
            }
        }
    }
    return rows;
}

}  // namespace bench
