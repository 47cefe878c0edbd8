/**
 * @file noise_field.hpp
 * @brief Seeded n-dimensional gradient noise field
 *
 * A NoiseField builds one gradient lattice at construction and answers
 * noise(point) queries against it. Query coordinates wrap per axis by the
 * grid size, so the field tiles space with period gridSize[i] along axis i.
 *
 * Usage:
 * ```cpp
 * NoiseField field({.seed = 123, .gridSize = std::vector<int32_t>{16, 16}});
 * double v = field.noise(glm::dvec2(3.25, 7.5));
 * ```
 *
 * Thread safety: the lattice is immutable after construction; noise() may
 * be called concurrently without locking.
 */

#pragma once

#include "ndnoise/lattice.hpp"

#include <array>
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <span>
#include <vector>

namespace ndnoise {

/// Grid size used when NoiseFieldConfig::gridSize is not set
constexpr std::array<int32_t, 3> kDefaultGridSize = {64, 64, 64};

struct NoiseFieldConfig {
    std::optional<uint64_t> seed;                 ///< nullopt: draw from std::random_device
    std::optional<std::vector<int32_t>> gridSize; ///< Cells per axis; nullopt: kDefaultGridSize
};

class NoiseField {
public:
    /**
     * @brief Build the field's lattice
     * @throws ConfigurationError if gridSize is empty, has more than
     *         kMaxDimension entries, or has an entry < 1
     */
    explicit NoiseField(const NoiseFieldConfig& config = {});

    /**
     * @brief Evaluate noise at a point
     *
     * Each coordinate is wrapped into [0, gridSize[i]) before evaluation.
     * The raw interpolated value is returned (nominally [-1, 1], not clamped).
     *
     * @throws DimensionMismatchError if coordinates.size() != dimension()
     */
    [[nodiscard]] double noise(std::span<const double> coordinates) const;

    [[nodiscard]] double noise(double x) const;
    [[nodiscard]] double noise(const glm::dvec2& p) const;
    [[nodiscard]] double noise(const glm::dvec3& p) const;
    [[nodiscard]] double noise(const glm::dvec4& p) const;

    [[nodiscard]] uint64_t seed() const { return seed_; }
    [[nodiscard]] int dimension() const { return lattice_.dimension(); }
    [[nodiscard]] const std::vector<int32_t>& gridSize() const { return lattice_.gridShape(); }
    [[nodiscard]] const Lattice& lattice() const { return lattice_; }

private:
    static uint64_t resolveSeed(const NoiseFieldConfig& config);
    static Lattice buildFieldLattice(const NoiseFieldConfig& config, uint64_t seed);

    uint64_t seed_;
    Lattice lattice_;
};

}  // namespace ndnoise
