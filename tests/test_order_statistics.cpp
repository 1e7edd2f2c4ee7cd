#include <algorithm>
#include <cstddef>
#include <limits>
#include <random>
#include <set>
#include <stdexcept>
#include <vector>
#include "../src/order_statistics.hpp"

using percentile::strategy_t;

static const strategy_t kStrategies[] = {strategy_t::sort, strategy_t::partial, strategy_t::quickselect};

// every strategy must agree with the sorted copy on every requested rank
static bool agrees_with_sorted(const std::vector<double>& data, const std::set<std::size_t>& ranks) {
    std::vector<double> sorted = data;
    std::sort(sorted.begin(), sorted.end());
    for (auto s : kStrategies) {
        const auto got = percentile::select(data, ranks, s);
        if (got.size() != ranks.size()) return false;
        for (auto k : ranks) {
            if (got.at(k) != sorted[k]) return false;
        }
    }
    return true;
}

int main() {
    const std::vector<double> data{9, 1, 5, 3, 7, 2, 8, 4, 6, 10};
    if (!agrees_with_sorted(data, {2, 3, 4, 5, 6, 7})) return 1;
    if (!agrees_with_sorted(data, {0, 9})) return 2;

    // caller's sequence is untouched
    const std::vector<double> before = data;
    for (auto s : kStrategies) percentile::select(data, {0, 4, 9}, s);
    if (data != before) return 3;

    // heavy duplication
    std::vector<double> dups;
    for (int i = 0; i < 500; ++i) dups.push_back(static_cast<double>(i % 3));
    if (!agrees_with_sorted(dups, {0, 166, 167, 250, 333, 334, 499})) return 4;
    if (!agrees_with_sorted(std::vector<double>(64, 7.0), {0, 31, 63})) return 5;

    // already ordered / reversed inputs
    std::vector<double> asc(1000);
    for (std::size_t i = 0; i < asc.size(); ++i) asc[i] = static_cast<double>(i);
    std::vector<double> desc(asc.rbegin(), asc.rend());
    if (!agrees_with_sorted(asc, {249, 250, 499, 500, 749, 750})) return 6;
    if (!agrees_with_sorted(desc, {249, 250, 499, 500, 749, 750})) return 7;

    // infinities order like any other value
    const double inf = std::numeric_limits<double>::infinity();
    if (!agrees_with_sorted({3.0, inf, -inf, 1.0, 2.0}, {0, 1, 2, 3, 4})) return 8;

    // random data, random rank sets
    std::mt19937_64 rng(7);
    std::uniform_real_distribution<double> dist(-1e6, 1e6);
    for (int round = 0; round < 50; ++round) {
        std::vector<double> v(1 + rng() % 300);
        for (auto& x : v) x = dist(rng);
        std::set<std::size_t> ranks;
        for (int i = 0; i < 4; ++i) ranks.insert(rng() % v.size());
        if (!agrees_with_sorted(v, ranks)) return 9;
    }

    // quickselect alone, including the single element case
    if (percentile::quickselect({42.0}, 0) != 42.0) return 10;
    if (percentile::quickselect({5, 4, 3, 2, 1}, 0) != 1.0) return 11;
    if (percentile::quickselect({5, 4, 3, 2, 1}, 4) != 5.0) return 12;

    // empty rank set, out of range rank
    for (auto s : kStrategies) {
        if (!percentile::select(data, {}, s).empty()) return 13;
        try {
            percentile::select(data, {10}, s);
            return 14;
        } catch (const std::out_of_range&) {
        }
    }

    // strategy names
    for (auto s : kStrategies) {
        if (percentile::parse_strategy(percentile::strategy_name(s)) != s) return 15;
    }
    try {
        percentile::parse_strategy("heap");
        return 16;
    } catch (const std::invalid_argument&) {
    }
    return 0;
}
