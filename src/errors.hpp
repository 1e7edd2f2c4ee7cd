#pragma once
/**
 * \file errors.hpp
 * \brief Exception types raised by the percentile engine
 */

#include <stdexcept>
#include <string>
#include <utility>

namespace percentile {

/// Base class of every classified engine failure.
class error : public std::runtime_error {
public:
    explicit error(const std::string& what) : std::runtime_error(what) {}
};

/// Raw input is not a sequence of samples.
class input_shape_error : public error {
public:
    explicit input_shape_error(const std::string& what) : error(what) {}
};

/// An element is neither numeric nor an absence marker.
class element_type_error : public error {
public:
    element_type_error(const std::string& what, std::string kind)
        : error(what), _kind(std::move(kind)) {
    }

    const std::string& kind() const noexcept { return _kind; }

private:
    std::string _kind;
};

/// No valid numeric element survived sanitization.
class empty_data_error : public error {
public:
    explicit empty_data_error(const std::string& what) : error(what) {}
};

}  // namespace percentile
