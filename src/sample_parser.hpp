#pragma once
/**
 * \file sample_parser.hpp
 * \brief Text -> raw sample conversion (list literals and single cells)
 */

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "sanitizer.hpp"

namespace percentile {

inline std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

/// Classify one token:
///  - "" / null / none / na -> null
///  - integer literal       -> int (falls back to float when out of range)
///  - float literal, nan, inf, -inf -> float
///  - quoted or anything else -> string
inline sample_t parse_sample(std::string_view token) {
    token = trim(token);
    const std::string lower = to_lower(token);
    if (lower.empty() || lower == "null" || lower == "none" || lower == "na") {
        return std::monostate{};
    }
    if (token.size() >= 2 && (token.front() == '"' || token.front() == '\'') && token.back() == token.front()) {
        return std::string(token.substr(1, token.size() - 2));
    }

    // from_chars does not accept a leading '+'
    std::string_view digits = token;
    if (digits.front() == '+') digits.remove_prefix(1);
    std::int64_t i = 0;
    const char* end = digits.data() + digits.size();
    auto res = std::from_chars(digits.data(), end, i);
    if (res.ec == std::errc() && res.ptr == end) {
        return i;
    }

    // strtod saturates overflow to +-HUGE_VAL and accepts nan / inf
    const std::string s(token);
    char* parsed_end = nullptr;
    const double d = std::strtod(s.c_str(), &parsed_end);
    if (parsed_end == s.c_str() + s.size()) {
        return d;
    }
    return std::string(token);
}

/// Parse a bracketed list literal: "[1, null, 2.5, nan, \"x\"]".
/// Throws input_shape_error if the text is not a list.
inline std::vector<sample_t> parse_sample_list(std::string_view text) {
    text = trim(text);
    if (text.empty() || text.front() != '[') {
        throw input_shape_error(std::string("Expected a sequence, got ") + sample_kind_name(parse_sample(text)));
    }
    if (text.back() != ']') {
        throw input_shape_error("Malformed sequence: missing closing ']'");
    }
    text = trim(text.substr(1, text.size() - 2));

    std::vector<sample_t> out;
    if (text.empty()) return out;

    std::size_t start = 0;
    char quote = 0;
    for (std::size_t i = 0; i <= text.size(); ++i) {
        if (i < text.size()) {
            const char c = text[i];
            if (quote) {
                if (c == quote) quote = 0;
                continue;
            }
            if (c == '"' || c == '\'') {
                quote = c;
                continue;
            }
            if (c != ',') continue;
        }
        const auto item = trim(text.substr(start, i - start));
        if (item.empty()) {
            throw input_shape_error("Malformed sequence: empty element at position " + std::to_string(out.size()));
        }
        out.push_back(parse_sample(item));
        start = i + 1;
    }
    return out;
}

}  // namespace percentile
