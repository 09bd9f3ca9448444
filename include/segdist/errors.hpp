#pragma once

#include <fmt/core.h>
#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>

namespace segdist {

/// A shape, scale or location parameter violates its documented domain.
/// Thrown at construction, never at evaluation time.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
};

/// A parameter is valid in principle but falls outside the branches the
/// decomposition handles (e.g. chi-square with df < 1).
class UnsupportedParameterRange : public std::domain_error {
public:
    explicit UnsupportedParameterRange(const std::string& what) : std::domain_error(what) {}
};

namespace detail {

inline void require_finite(double value, std::string_view family, std::string_view name) {
    if (!std::isfinite(value)) {
        throw InvalidParameter(fmt::format("{}: {} must be finite, got {}", family, name, value));
    }
}

inline void require_positive(double value, std::string_view family, std::string_view name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw InvalidParameter(fmt::format("{}: {} must be positive, got {}", family, name, value));
    }
}

} // namespace detail

} // namespace segdist
