#pragma once
/**
 * \file percentile_calculator.hpp
 * \brief Точный калькулятор квантилей с интерполяцией.
 *
 * Поведение:
 *  - входные данные очищаются (null и NaN отбрасываются, int -> double);
 *  - для каждого запрошенного квантиля q вычисляется позиция (n - 1) * q,
 *    её нижний/верхний индекс и вес;
 *  - все нужные индексы объединяются и разрешаются ОДНИМ вызовом select()
 *    выбранной стратегией (sort / partial / quickselect);
 *  - значения квантилей получаются линейной интерполяцией.
 *
 * По умолчанию используется стратегия partial (nth_element + сортировка префикса).
 */

#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "interpolation.hpp"
#include "order_statistics.hpp"
#include "sanitizer.hpp"

namespace percentile {

    /// Квартильный набор по умолчанию (p25, p50, p75).
    struct quartiles_t {
        double p25;
        double p50;
        double p75;
    };

    inline const std::vector<double>& default_quantiles() {
        static const std::vector<double> q{0.25, 0.50, 0.75};
        return q;
    }

    class calculator {
    public:
        explicit calculator(strategy_t strategy = strategy_t::partial)
            : _strategy(strategy) {
        }

        strategy_t strategy() const { return _strategy; }

        /// Квантили по произвольному набору долей; ключ результата — доля.
        std::map<double, double> calculate(const std::vector<sample_t>& samples,
                                           const std::vector<double>& fractions) const {
            return calculate_clean(sanitize(samples), fractions);
        }

        std::map<double, double> calculate(const std::vector<double>& values,
                                           const std::vector<double>& fractions) const {
            return calculate_clean(sanitize(values), fractions);
        }

        quartiles_t calculate_quartiles(const std::vector<sample_t>& samples) const {
            return to_quartiles(calculate(samples, default_quantiles()));
        }

        quartiles_t calculate_quartiles(const std::vector<double>& values) const {
            return to_quartiles(calculate(values, default_quantiles()));
        }

        double median(const std::vector<sample_t>& samples) const {
            return calculate(samples, {0.5}).at(0.5);
        }

        double median(const std::vector<double>& values) const {
            return calculate(values, {0.5}).at(0.5);
        }

    private:
        std::map<double, double> calculate_clean(const std::vector<double>& clean,
                                                 const std::vector<double>& fractions) const {
            if (clean.empty()) {
                throw empty_data_error("Cannot calculate percentiles: no valid numeric data");
            }
            for (double q : fractions) {
                check_fraction(q);
            }

            std::map<double, double> result;
            const std::size_t n = clean.size();

            // единственный элемент: все квантили совпадают, выбор не нужен
            if (n == 1) {
                for (double q : fractions) {
                    result[q] = clean.front();
                }
                return result;
            }

            std::vector<rank_position_t> positions;
            positions.reserve(fractions.size());
            std::set<std::size_t> required;
            for (double q : fractions) {
                auto r = rank_position(n, q);
                required.insert(r.low);
                required.insert(r.high);
                positions.push_back(r);
            }

            const auto stats = select(clean, required, _strategy);
            spdlog::debug("percentile: n={} strategy={} ranks={}", n, strategy_name(_strategy),
                          required.size());

            for (std::size_t i = 0; i < fractions.size(); ++i) {
                const auto& r = positions[i];
                result[fractions[i]] = interpolate(stats.at(r.low), stats.at(r.high), r.weight);
            }
            return result;
        }

        static quartiles_t to_quartiles(const std::map<double, double>& m) {
            return quartiles_t{m.at(0.25), m.at(0.50), m.at(0.75)};
        }

    private:
        strategy_t _strategy;
    };

} // namespace percentile
