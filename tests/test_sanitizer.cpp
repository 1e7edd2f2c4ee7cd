#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include "../src/sanitizer.hpp"

int main() {
    using percentile::sample_t;
    using percentile::sanitize;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    // nulls and NaNs are dropped, ints widened, order kept
    std::vector<sample_t> raw{std::int64_t{3}, std::monostate{}, 1.5, nan, std::int64_t{-2}, std::monostate{}};
    auto clean = sanitize(raw);
    if (clean != std::vector<double>{3.0, 1.5, -2.0}) return 1;

    // infinities survive
    std::vector<sample_t> with_inf{1.0, inf, -inf};
    auto kept = sanitize(with_inf);
    if (kept.size() != 3 || kept[1] != inf || kept[2] != -inf) return 2;

    // only absent markers -> empty, not an error
    std::vector<sample_t> all_null{std::monostate{}, nan, std::monostate{}};
    if (!sanitize(all_null).empty()) return 3;
    std::vector<sample_t> none;
    if (!sanitize(none).empty()) return 4;

    // text elements are rejected with their kind
    std::vector<sample_t> bad{std::int64_t{1}, std::int64_t{2}, std::string("x"), std::int64_t{4}};
    try {
        sanitize(bad);
        return 5;
    } catch (const percentile::element_type_error& ex) {
        if (ex.kind() != "string") return 6;
        if (std::string(ex.what()).find("must be numeric") == std::string::npos) return 7;
    }

    // idempotent on its own output
    std::vector<double> numeric{4.0, nan, 2.0, inf, nan};
    auto once = sanitize(numeric);
    auto twice = sanitize(once);
    if (once != twice || once.size() != 3) return 8;

    if (std::string(percentile::sample_kind_name(sample_t{std::int64_t{1}})) != "int") return 9;
    if (std::string(percentile::sample_kind_name(sample_t{})) != "null") return 10;
    return 0;
}
