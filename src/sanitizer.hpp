#pragma once
/**
 * \file sanitizer.hpp
 * \brief Raw sample representation and input sanitization
 */

#include <cmath>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "errors.hpp"

namespace percentile {

/// One raw input entry: absent marker, integer, floating value or an
/// element of unrecognized kind (kept as its text).
using sample_t = std::variant<std::monostate, std::int64_t, double, std::string>;

/// Human readable kind of a raw entry, used in type errors.
inline const char* sample_kind_name(const sample_t& sample) {
    switch (sample.index()) {
        case 0: return "null";
        case 1: return "int";
        case 2: return "float";
        case 3: return "string";
    }
    return "unknown";
}

/// Drops nulls and NaNs, widens integers to double, keeps infinities.
/// Throws element_type_error on the first non-numeric element.
/// An empty result is not an error here.
inline std::vector<double> sanitize(const std::vector<sample_t>& raw) {
    std::vector<double> clean;
    clean.reserve(raw.size());
    for (const auto& sample : raw) {
        if (std::holds_alternative<std::monostate>(sample)) {
            continue;
        }
        if (const auto* i = std::get_if<std::int64_t>(&sample)) {
            clean.push_back(static_cast<double>(*i));
            continue;
        }
        if (const auto* d = std::get_if<double>(&sample)) {
            if (std::isnan(*d)) continue;
            clean.push_back(*d);
            continue;
        }
        const std::string kind = sample_kind_name(sample);
        throw element_type_error("All values must be numeric, got " + kind, kind);
    }
    return clean;
}

/// Already numeric input: only NaNs are dropped.
inline std::vector<double> sanitize(const std::vector<double>& raw) {
    std::vector<double> clean;
    clean.reserve(raw.size());
    for (double v : raw) {
        if (!std::isnan(v)) clean.push_back(v);
    }
    return clean;
}

}  // namespace percentile
