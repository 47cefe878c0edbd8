/**
 * @file errors.hpp
 * @brief Exception types thrown by the noise library
 *
 * All errors are raised synchronously at the offending call and leave no
 * partial state behind.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ndnoise {

/// Invalid dimension, grid shape, corner count, or config value
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// Query point arity differs from the field's dimension
class DimensionMismatchError : public std::invalid_argument {
public:
    explicit DimensionMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// A lattice coordinate required by a query has no stored gradient
class LatticeBoundsError : public std::out_of_range {
public:
    explicit LatticeBoundsError(const std::string& what)
        : std::out_of_range(what) {}
};

}  // namespace ndnoise
