/**
 * @file interpolation.hpp
 * @brief Smoothstep blending of cell corner scalars
 *
 * The smoothstep curve t^2 (3 - 2t) has zero slope at t = 0 and t = 1, so
 * the gradient of the blended field at each lattice node equals that node's
 * stored gradient.
 */

#pragma once

#include <span>
#include <vector>

namespace ndnoise {

/// Clamp t to [0, 1] and return t^2 (3 - 2t)
[[nodiscard]] double smoothstep(double t);

/// point[i] - floor(point[i]) per axis, each in [0, 1)
[[nodiscard]] std::vector<double> fractionalCoordinates(std::span<const double> point);

/// a0 + smoothstep(t) * (a1 - a0)
[[nodiscard]] double interpolate1D(double a0, double a1, double t);

/**
 * @brief Blend 2^n corner scalars down to one value
 *
 * Corners must be ordered as produced by evaluateCell: bit d of the corner
 * index selects the lower or upper side of axis d. Axis 0 is reduced first,
 * each pair blended with interpolate1D using that axis's fractional
 * coordinate. The result lies within [min, max] of the inputs.
 *
 * @param cornerScalars Exactly 2^point.size() values
 * @param point Query point (only its fractional part is used)
 * @throws ConfigurationError if point is empty, has more than kMaxDimension
 *         axes, or the scalar count is not 2^point.size()
 */
[[nodiscard]] double interpolate(std::span<const double> cornerScalars,
                                 std::span<const double> point);

/// Linear rescale of a noise value
[[nodiscard]] inline double scaleNoiseValue(double value, double factor = 1.0) {
    return value * factor;
}

}  // namespace ndnoise
