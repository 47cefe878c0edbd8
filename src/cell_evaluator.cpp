/**
 * @file cell_evaluator.cpp
 * @brief Corner enumeration and gradient dot products
 */

#include "ndnoise/cell_evaluator.hpp"
#include "ndnoise/errors.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace ndnoise {

namespace {

std::string formatCoords(std::span<const int32_t> coords) {
    std::string out;
    for (size_t i = 0; i < coords.size(); ++i) {
        if (i > 0) out += ',';
        out += std::to_string(coords[i]);
    }
    return out;
}

}  // namespace

CornerScalars evaluateCell(const Lattice& lattice, std::span<const double> point) {
    const auto n = static_cast<size_t>(lattice.dimension());
    if (point.size() != n) {
        throw DimensionMismatchError("Point dimension (" + std::to_string(point.size()) +
                                     ") must match lattice dimension (" +
                                     std::to_string(n) + ")");
    }

    // Locate the enclosing cell
    std::array<int32_t, kMaxDimension> cell{};
    for (size_t axis = 0; axis < n; ++axis) {
        double f = std::floor(point[axis]);
        if (!std::isfinite(f) ||
            f < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
            f >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
            throw LatticeBoundsError("Point coordinate " + std::to_string(point[axis]) +
                                     " on axis " + std::to_string(axis) +
                                     " is outside any lattice cell");
        }
        cell[axis] = static_cast<int32_t>(f);
    }

    CornerScalars scalars;
    std::array<int32_t, kMaxDimension> corner{};
    const size_t cornerCount = size_t{1} << n;

    for (size_t i = 0; i < cornerCount; ++i) {
        for (size_t axis = 0; axis < n; ++axis) {
            corner[axis] = cell[axis] + static_cast<int32_t>((i >> axis) & 1);
        }

        std::span<const int32_t> cornerCoords(corner.data(), n);
        auto gradient = lattice.find(cornerCoords);
        if (!gradient) {
            throw LatticeBoundsError("Gradient not found at vertex " +
                                     formatCoords(cornerCoords) +
                                     "; point lies outside the lattice");
        }

        double dot = 0.0;
        for (size_t axis = 0; axis < n; ++axis) {
            dot += (*gradient)[axis] * (point[axis] - static_cast<double>(corner[axis]));
        }
        scalars.push(dot);
    }

    return scalars;
}

}  // namespace ndnoise
