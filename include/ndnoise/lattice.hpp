/**
 * @file lattice.hpp
 * @brief Seeded gradient lattice for n-dimensional gradient noise
 *
 * A Lattice holds one pseudo-random gradient at every integer intersection
 * of an n-dimensional grid. Axis i spans coordinates 0..gridShape[i]
 * inclusive, so the lattice stores prod(gridShape[i] + 1) gradients.
 *
 * Gradients are stored densely, axis 0 outermost and the last axis varying
 * fastest. The same (dimension, gridShape, seed) always yields a
 * bit-identical lattice.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace ndnoise {

/// Largest supported number of axes
constexpr int kMaxDimension = 10;

/// Corners of a hypercube cell at kMaxDimension
constexpr size_t kMaxCorners = size_t{1} << kMaxDimension;

/// Read-only view of one gradient: n components, unit length for n >= 2
using Gradient = std::span<const double>;

class Lattice;

[[nodiscard]] Lattice buildLattice(int dimension, std::span<const int32_t> gridShape,
                                   uint64_t seed);

// ============================================================================
// Lattice
// ============================================================================

class Lattice {
public:
    Lattice(const Lattice&) = default;
    Lattice(Lattice&&) noexcept = default;
    Lattice& operator=(const Lattice&) = default;
    Lattice& operator=(Lattice&&) noexcept = default;

    [[nodiscard]] int dimension() const { return dimension_; }
    [[nodiscard]] const std::vector<int32_t>& gridShape() const { return gridShape_; }

    /// Number of stored gradients
    [[nodiscard]] size_t size() const { return count_; }

    /// Check whether coords names a stored intersection
    [[nodiscard]] bool contains(std::span<const int32_t> coords) const;

    /// Gradient at coords, or nullopt when coords is outside the lattice
    [[nodiscard]] std::optional<Gradient> find(std::span<const int32_t> coords) const;

    // ---- Ordered traversal ----

    /// Gradient of the index-th entry in traversal order
    /// @throws LatticeBoundsError if index >= size()
    [[nodiscard]] Gradient gradientAt(size_t index) const;

    /// Coordinates of the index-th entry in traversal order
    /// @throws LatticeBoundsError if index >= size()
    [[nodiscard]] std::vector<int32_t> coordinateAt(size_t index) const;

private:
    Lattice(int dimension, std::span<const int32_t> gridShape, size_t count);

    [[nodiscard]] std::optional<size_t> indexOf(std::span<const int32_t> coords) const;

    int dimension_ = 0;
    std::vector<int32_t> gridShape_;
    std::vector<size_t> strides_;
    size_t count_ = 0;
    std::vector<double> components_;  ///< count_ * dimension_ values

    friend Lattice buildLattice(int dimension, std::span<const int32_t> gridShape,
                                uint64_t seed);
};

// ============================================================================
// Construction and lookup
// ============================================================================

/**
 * @brief Build the gradient lattice for a grid
 *
 * For dimension 1 each gradient is a single value drawn uniformly from
 * [-1, 1). For dimension >= 2 each gradient is n uniform draws normalized to
 * unit length (an all-zero draw stays zero).
 *
 * @param dimension Number of axes, 1..kMaxDimension
 * @param gridShape Cell count per axis (>= 0); size must equal dimension
 * @param seed Seed for the gradient stream
 * @throws ConfigurationError on an invalid dimension or grid shape
 */
[[nodiscard]] Lattice buildLattice(int dimension, std::span<const int32_t> gridShape,
                                   uint64_t seed);

/// Non-throwing probe: gradient at coords, or nullopt if not in the lattice
[[nodiscard]] std::optional<Gradient> lookupGradient(const Lattice& lattice,
                                                     std::span<const int32_t> coords);

}  // namespace ndnoise
