#include <cmath>
#include <limits>
#include <stdexcept>
#include "../src/interpolation.hpp"

int main() {
    using percentile::interpolate;
    using percentile::rank_position;

    if (interpolate(10.0, 20.0, 0.0) != 10.0) return 1;
    if (interpolate(10.0, 20.0, 1.0) != 20.0) return 2;
    if (interpolate(10.0, 20.0, 0.25) != 12.5) return 3;
    if (interpolate(5.0, 5.0, 0.7) != 5.0) return 4;
    const double inf = std::numeric_limits<double>::infinity();
    if (interpolate(inf, inf, 0.0) != inf) return 13;
    if (interpolate(1.0, inf, 0.5) != inf) return 14;

    // n = 10: positions 2.25 / 4.5 / 6.75
    auto r25 = rank_position(10, 0.25);
    if (r25.low != 2 || r25.high != 3 || std::fabs(r25.weight - 0.25) > 1e-12) return 5;
    auto r50 = rank_position(10, 0.5);
    if (r50.low != 4 || r50.high != 5 || std::fabs(r50.weight - 0.5) > 1e-12) return 6;
    auto r75 = rank_position(10, 0.75);
    if (r75.low != 6 || r75.high != 7 || std::fabs(r75.weight - 0.75) > 1e-12) return 7;

    // whole positions collapse low == high
    auto r_exact = rank_position(5, 0.5);
    if (r_exact.low != 2 || r_exact.high != 2 || r_exact.weight != 0.0) return 8;
    auto r_max = rank_position(7, 1.0);
    if (r_max.low != 6 || r_max.high != 6) return 9;
    auto r_single = rank_position(1, 0.75);
    if (r_single.low != 0 || r_single.high != 0) return 10;

    try {
        rank_position(10, 1.5);
        return 11;
    } catch (const std::invalid_argument&) {
    }
    try {
        rank_position(10, std::nan(""));
        return 12;
    } catch (const std::invalid_argument&) {
    }
    return 0;
}
