#pragma once
/**
 * \file interpolation.hpp
 * \brief Rank positions and linear interpolation between order statistics
 */

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace percentile {

/// Fractional zero-based rank of a quantile in a sequence of length n.
struct rank_position_t {
    double position;
    std::size_t low;
    std::size_t high;
    double weight;
};

/// Throws std::invalid_argument unless q is in [0, 1].
inline void check_fraction(double q) {
    if (!(q >= 0.0 && q <= 1.0)) {
        throw std::invalid_argument("Quantile fraction must be in [0, 1], got " + std::to_string(q));
    }
}

/// position = (n - 1) * q, split into floor/ceil indices and the weight between them.
/// n must be >= 1.
inline rank_position_t rank_position(std::size_t n, double q) {
    check_fraction(q);
    const double position = static_cast<double>(n - 1) * q;
    const double lo = std::floor(position);
    rank_position_t r;
    r.position = position;
    r.low = static_cast<std::size_t>(lo);
    r.high = static_cast<std::size_t>(std::ceil(position));
    r.weight = position - lo;
    return r;
}

/// low + (high - low) * weight. A zero weight returns low as is, so that an
/// infinite order statistic hit exactly does not turn into inf - inf = NaN.
inline double interpolate(double low_value, double high_value, double weight) {
    if (weight == 0.0) return low_value;
    return low_value + (high_value - low_value) * weight;
}

}  // namespace percentile
