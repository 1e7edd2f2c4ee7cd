#pragma once
/**
 * \file csv_reader.hpp
 * \brief CSV reading utilities
 */

#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdint>
#include <optional>
#include <algorithm>

#include "sample_parser.hpp"

namespace csv {

/// Split line by separator (simple, not handling quotes)
inline std::vector<std::string> split_line(const std::string& line, char sep = ';') {
    std::vector<std::string> out;
    std::string token;
    out.reserve(8);
    std::istringstream ss(line);
    while (std::getline(ss, token, sep)) {
        out.push_back(token);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == sep) {
        out.emplace_back();
    }
    return out;
}

/// Collect .csv files of dir (case-insensitive extension) whose name contains
/// one of masks (all of them if masks is empty), sorted by path.
inline std::vector<std::filesystem::path> list_csv_files(const std::filesystem::path& dir,
                                                         const std::vector<std::string>& masks) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        const auto fname = entry.path().filename().string();
        std::string ext_lower = entry.path().extension().string();
        std::transform(ext_lower.begin(), ext_lower.end(), ext_lower.begin(), ::tolower);
        if (ext_lower != ".csv") continue;

        bool pass = masks.empty();
        for (const auto& m : masks) {
            if (fname.find(m) != std::string::npos) { pass = true; break; }
        }
        if (pass) files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

/// Reads column `column` of one CSV file and appends every cell as a raw sample.
/// Empty cells become null samples, non-numeric cells stay as text so that the
/// sanitizer can reject them.
inline std::optional<std::string> read_csv_column(const std::filesystem::path& file,
                                                  const std::string& column,
                                                  char sep,
                                                  std::vector<percentile::sample_t>& out_samples) {
    std::ifstream ifs(file);
    if (!ifs.is_open()) {
        return std::string("Failed to open CSV file: ") + file.string();
    }

    std::string header;
    if (!std::getline(ifs, header)) {
        // empty file -> nothing to read
        return std::nullopt;
    }
    auto cols = split_line(header, sep);
    int idx_value = -1;
    for (size_t i = 0; i < cols.size(); ++i) {
        if (percentile::trim(cols[i]) == column) { idx_value = int(i); break; }
    }
    if (idx_value < 0) {
        return std::string("CSV missing required column '") + column + "' in file: " + file.string();
    }

    std::string line;
    std::uint64_t line_no = 1;
    while (std::getline(ifs, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto vals = split_line(line, sep);
        if (vals.size() <= static_cast<size_t>(idx_value)) {
            return std::string("Malformed CSV (not enough columns) in file ") + file.string() +
                   " at line " + std::to_string(line_no);
        }
        out_samples.push_back(percentile::parse_sample(vals[idx_value]));
    }
    return std::nullopt;
}

/// Reads column `column` from the CSV files of dir filtered by masks.
/// Returns error string on failure.
inline std::optional<std::string> read_csv_files(const std::filesystem::path& dir,
                                                 const std::vector<std::string>& masks,
                                                 const std::string& column,
                                                 char sep,
                                                 std::vector<percentile::sample_t>& out_samples) {
    if (!std::filesystem::exists(dir)) {
        return std::string("Input directory does not exist: ") + dir.string();
    }
    if (!std::filesystem::is_directory(dir)) {
        return std::string("Input path is not a directory: ") + dir.string();
    }

    out_samples.clear();
    for (const auto& file : list_csv_files(dir, masks)) {
        if (auto err = read_csv_column(file, column, sep, out_samples); err) {
            return err;
        }
    }
    return std::nullopt;
}

}  // namespace csv
