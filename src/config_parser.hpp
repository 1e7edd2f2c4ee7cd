#pragma once
/**
 * \file config_parser.hpp
 * \brief TOML config parsing helpers
 */

#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

#include <toml++/toml.h>

#include "order_statistics.hpp"
#include "interpolation.hpp"
#include "percentile_calculator.hpp"

namespace cfg {

struct benchmark_config_t {
    std::vector<std::size_t> sizes{100, 1000, 10000, 100000};
    std::uint64_t seed = 42;
    int repeats = 3;
};

struct main_config_t {
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    std::vector<std::string> filename_mask;
    std::string column = "value";
    char separator = ';';

    percentile::strategy_t strategy = percentile::strategy_t::partial;
    std::vector<double> quantiles = percentile::default_quantiles();

    benchmark_config_t benchmark;
};

/// Parse TOML config located at path. Returns error string on failure.
inline std::optional<std::string> parse_config(const std::filesystem::path& path,
                                               main_config_t& out_config) {
    try {
        if (!std::filesystem::exists(path)) {
            return std::string("Config file not found: ") + path.string();
        }
        const auto tbl = toml::parse_file(path.string());

        auto main_node = tbl["main"];
        if (!main_node) {
            return std::string("Missing [main] section in config");
        }

        // input (required)
        if (auto in = main_node["input"].value<std::string>(); in) {
            out_config.input_dir = std::filesystem::path(*in);
        } else {
            return std::string("Config error: 'main.input' is required and must be a string");
        }

        // output (optional)
        if (auto out = main_node["output"].value<std::string>(); out) {
            out_config.output_dir = std::filesystem::path(*out);
        } else {
            // default -> 'output' in cwd (handled by caller)
            out_config.output_dir.clear();
        }

        // filename_mask (optional array of strings)
        out_config.filename_mask.clear();
        if (auto masks = main_node["filename_mask"]; masks && masks.is_array()) {
            for (const auto& item : *masks.as_array()) {
                if (auto s = item.value<std::string>(); s) {
                    out_config.filename_mask.push_back(*s);
                }
            }
        }

        if (auto col = main_node["column"].value<std::string>(); col) {
            out_config.column = *col;
        }
        if (auto sep = main_node["separator"].value<std::string>(); sep) {
            if (sep->size() != 1) {
                return std::string("Config error: 'main.separator' must be a single character");
            }
            out_config.separator = sep->front();
        }

        // [engine] (optional)
        if (auto engine = tbl["engine"]; engine) {
            if (auto s = engine["strategy"].value<std::string>(); s) {
                out_config.strategy = percentile::parse_strategy(*s);
            }
            if (auto qs = engine["quantiles"]; qs && qs.is_array()) {
                out_config.quantiles.clear();
                for (const auto& item : *qs.as_array()) {
                    auto q = item.value<double>();
                    if (!q) {
                        return std::string("Config error: 'engine.quantiles' must contain numbers");
                    }
                    percentile::check_fraction(*q);
                    out_config.quantiles.push_back(*q);
                }
                if (out_config.quantiles.empty()) {
                    return std::string("Config error: 'engine.quantiles' must not be empty");
                }
            }
        }

        // [benchmark] (optional)
        if (auto bench = tbl["benchmark"]; bench) {
            if (auto sizes = bench["sizes"]; sizes && sizes.is_array()) {
                out_config.benchmark.sizes.clear();
                for (const auto& item : *sizes.as_array()) {
                    auto n = item.value<std::int64_t>();
                    if (!n || *n <= 0) {
                        return std::string("Config error: 'benchmark.sizes' must contain positive integers");
                    }
                    out_config.benchmark.sizes.push_back(static_cast<std::size_t>(*n));
                }
            }
            if (auto seed = bench["seed"].value<std::int64_t>(); seed) {
                out_config.benchmark.seed = static_cast<std::uint64_t>(*seed);
            }
            if (auto repeats = bench["repeats"].value<std::int64_t>(); repeats) {
                if (*repeats < 1) {
                    return std::string("Config error: 'benchmark.repeats' must be >= 1");
                }
                out_config.benchmark.repeats = static_cast<int>(*repeats);
            }
        }
    } catch (const toml::parse_error& ex) {
        return std::string("TOML parse error: ") + ex.what();
    } catch (const std::invalid_argument& ex) {
        return std::string("Config error: ") + ex.what();
    } catch (const std::exception& ex) {
        return std::string("Config parse exception: ") + ex.what();
    }
    return std::nullopt;
}

}  // namespace cfg
