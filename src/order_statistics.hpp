#pragma once
/**
 * \file order_statistics.hpp
 * \brief Order-statistic selection: full sort, partial selection, quickselect
 *
 * All strategies answer the same question: for every requested zero-based
 * rank k, which value would sit at position k if the sequence were sorted
 * ascending. The caller's sequence is never modified.
 */

#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace percentile {

enum class strategy_t {
    sort,
    partial,
    quickselect
};

inline const char* strategy_name(strategy_t s) {
    switch (s) {
        case strategy_t::sort: return "sort";
        case strategy_t::partial: return "partial";
        case strategy_t::quickselect: return "quickselect";
    }
    return "?";
}

/// Parse "sort" / "partial" / "quickselect". Throws std::invalid_argument otherwise.
inline strategy_t parse_strategy(const std::string& name) {
    if (name == "sort") return strategy_t::sort;
    if (name == "partial") return strategy_t::partial;
    if (name == "quickselect") return strategy_t::quickselect;
    throw std::invalid_argument("Unknown selection strategy: '" + name + "'");
}

using order_statistics_t = std::map<std::size_t, double>;

namespace detail {

inline void check_indices(std::size_t n, const std::set<std::size_t>& indices) {
    if (!indices.empty() && *indices.rbegin() >= n) {
        throw std::out_of_range("Rank " + std::to_string(*indices.rbegin()) +
                                " out of range for sequence of size " + std::to_string(n));
    }
}

/// Orders arr[low], arr[mid], arr[high] and parks the median at arr[high].
/// Returns the pivot value.
inline double median_of_three(std::vector<double>& arr, std::size_t low, std::size_t high) {
    const std::size_t mid = low + (high - low) / 2;
    if (arr[low] > arr[mid]) std::swap(arr[low], arr[mid]);
    if (arr[mid] > arr[high]) std::swap(arr[mid], arr[high]);
    if (arr[low] > arr[mid]) std::swap(arr[low], arr[mid]);
    std::swap(arr[mid], arr[high]);
    return arr[high];
}

/// 3-way partition of arr[low..high] around a median-of-three pivot.
/// On return arr[low..lt) < pivot, arr[lt..gt] == pivot, arr(gt..high] > pivot.
inline std::pair<std::size_t, std::size_t> partition_3way(std::vector<double>& arr,
                                                          std::size_t low, std::size_t high) {
    const double pivot = median_of_three(arr, low, high);
    std::size_t lt = low;
    std::size_t gt = high;
    std::size_t i = low;
    while (i <= gt) {
        if (arr[i] < pivot) {
            std::swap(arr[lt], arr[i]);
            ++lt;
            ++i;
        } else if (arr[i] > pivot) {
            std::swap(arr[i], arr[gt]);
            // the equal zone always holds the pivot, so gt never passes lt
            --gt;
        } else {
            ++i;
        }
    }
    return {lt, gt};
}

}  // namespace detail

/// Iterative quickselect on a private scratch buffer. Destroys the buffer's order.
/// k must be < arr.size().
inline double quickselect(std::vector<double> arr, std::size_t k) {
    std::size_t low = 0;
    std::size_t high = arr.size() - 1;
    while (low < high) {
        const auto [lt, gt] = detail::partition_3way(arr, low, high);
        if (k < lt) {
            high = lt - 1;
        } else if (k > gt) {
            low = gt + 1;
        } else {
            return arr[k];
        }
    }
    return arr[k];
}

/// Full sort of a copy, then direct indexing.
inline order_statistics_t select_by_sort(const std::vector<double>& sequence,
                                         const std::set<std::size_t>& indices) {
    detail::check_indices(sequence.size(), indices);
    order_statistics_t out;
    if (indices.empty()) return out;
    std::vector<double> sorted = sequence;
    std::sort(sorted.begin(), sorted.end());
    for (auto k : indices) out[k] = sorted[k];
    return out;
}

/// Moves the m = max(indices) + 1 smallest values to the front, sorts only
/// those m and indexes into the sorted prefix. O(n + m log m).
inline order_statistics_t select_partial(const std::vector<double>& sequence,
                                         const std::set<std::size_t>& indices) {
    detail::check_indices(sequence.size(), indices);
    order_statistics_t out;
    if (indices.empty()) return out;
    const std::size_t m = *indices.rbegin() + 1;
    std::vector<double> tmp = sequence;
    std::nth_element(tmp.begin(), tmp.begin() + (m - 1), tmp.end());
    std::sort(tmp.begin(), tmp.begin() + m);
    for (auto k : indices) out[k] = tmp[k];
    return out;
}

/// One independent quickselect per distinct index, each on a fresh copy.
inline order_statistics_t select_quickselect(const std::vector<double>& sequence,
                                             const std::set<std::size_t>& indices) {
    detail::check_indices(sequence.size(), indices);
    order_statistics_t out;
    for (auto k : indices) out[k] = quickselect(sequence, k);
    return out;
}

inline order_statistics_t select(const std::vector<double>& sequence,
                                 const std::set<std::size_t>& indices,
                                 strategy_t strategy) {
    switch (strategy) {
        case strategy_t::sort: return select_by_sort(sequence, indices);
        case strategy_t::partial: return select_partial(sequence, indices);
        case strategy_t::quickselect: return select_quickselect(sequence, indices);
    }
    throw std::invalid_argument("Unknown selection strategy");
}

}  // namespace percentile
