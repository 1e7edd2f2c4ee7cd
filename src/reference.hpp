#pragma once
/**
 * \file reference.hpp
 * \brief Brute-force quantiles (full sort + interpolate), used as ground truth
 */

#include <algorithm>
#include <cmath>
#include <map>
#include <vector>

#include "errors.hpp"
#include "interpolation.hpp"
#include "percentile_calculator.hpp"

namespace percentile::reference {

inline std::map<double, double> calculate(std::vector<double> values, const std::vector<double>& fractions) {
    if (values.empty()) {
        throw empty_data_error("Cannot calculate percentiles: no valid numeric data");
    }
    std::sort(values.begin(), values.end());
    const std::size_t n = values.size();
    std::map<double, double> out;
    for (double q : fractions) {
        check_fraction(q);
        const double pos = static_cast<double>(n - 1) * q;
        const auto lo = static_cast<std::size_t>(std::floor(pos));
        const auto hi = static_cast<std::size_t>(std::ceil(pos));
        out[q] = interpolate(values[lo], values[hi], pos - std::floor(pos));
    }
    return out;
}

inline quartiles_t quartiles(const std::vector<double>& values) {
    auto m = calculate(values, default_quantiles());
    return quartiles_t{m.at(0.25), m.at(0.50), m.at(0.75)};
}

}  // namespace percentile::reference
