/**
 * @file cell_evaluator.hpp
 * @brief Per-corner dot products for the lattice cell enclosing a point
 *
 * Corner ordering: corner index i (0 <= i < 2^n) offsets axis d by
 * ((i >> d) & 1). Corner 0 is the cell origin, corner 2^n - 1 the far
 * corner. The interpolator reduces corners in exactly this order.
 */

#pragma once

#include "ndnoise/lattice.hpp"

#include <array>
#include <cstddef>
#include <span>

namespace ndnoise {

/// Fixed-capacity buffer of corner scalars (no heap allocation)
class CornerScalars {
public:
    [[nodiscard]] size_t size() const { return count_; }
    [[nodiscard]] double operator[](size_t i) const { return values_[i]; }

    [[nodiscard]] std::span<const double> values() const {
        return std::span<const double>(values_.data(), count_);
    }

    void push(double value) { values_[count_++] = value; }

private:
    std::array<double, kMaxCorners> values_{};
    size_t count_ = 0;
};

/**
 * @brief Compute the 2^n corner scalars of the cell containing point
 *
 * Each scalar is dot(gradient(corner), point - corner).
 *
 * @throws DimensionMismatchError if point.size() != lattice.dimension()
 * @throws LatticeBoundsError if a corner of the cell is not in the lattice
 */
[[nodiscard]] CornerScalars evaluateCell(const Lattice& lattice, std::span<const double> point);

}  // namespace ndnoise
