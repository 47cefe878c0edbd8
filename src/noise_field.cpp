/**
 * @file noise_field.cpp
 * @brief NoiseField construction, coordinate wrapping and queries
 */

#include "ndnoise/noise_field.hpp"
#include "ndnoise/cell_evaluator.hpp"
#include "ndnoise/errors.hpp"
#include "ndnoise/interpolation.hpp"

#include <array>
#include <cmath>
#include <random>
#include <string>
#include <vector>

namespace ndnoise {

// ============================================================================
// Construction
// ============================================================================

NoiseField::NoiseField(const NoiseFieldConfig& config)
    : seed_(resolveSeed(config))
    , lattice_(buildFieldLattice(config, seed_))
{
}

uint64_t NoiseField::resolveSeed(const NoiseFieldConfig& config) {
    if (config.seed) {
        return *config.seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | static_cast<uint64_t>(rd());
}

Lattice NoiseField::buildFieldLattice(const NoiseFieldConfig& config, uint64_t seed) {
    const std::vector<int32_t> gridSize =
        config.gridSize ? *config.gridSize
                        : std::vector<int32_t>(kDefaultGridSize.begin(), kDefaultGridSize.end());
    if (gridSize.empty() || gridSize.size() > static_cast<size_t>(kMaxDimension)) {
        throw ConfigurationError("Grid size must have between 1 and " +
                                 std::to_string(kMaxDimension) + " entries, got " +
                                 std::to_string(gridSize.size()));
    }
    for (size_t axis = 0; axis < gridSize.size(); ++axis) {
        if (gridSize[axis] < 1) {
            throw ConfigurationError("Grid size entry " + std::to_string(axis) +
                                     " must be positive, got " +
                                     std::to_string(gridSize[axis]));
        }
    }
    return buildLattice(static_cast<int>(gridSize.size()), gridSize, seed);
}

// ============================================================================
// Queries
// ============================================================================

double NoiseField::noise(std::span<const double> coordinates) const {
    const auto n = static_cast<size_t>(dimension());
    if (coordinates.size() != n) {
        throw DimensionMismatchError("Noise dimension (" + std::to_string(coordinates.size()) +
                                     ") must match grid dimension (" +
                                     std::to_string(n) + ")");
    }

    // Wrap into [0, gridSize) so every corner, including cell + 1, is stored
    std::array<double, kMaxDimension> wrapped{};
    const auto& grid = gridSize();
    for (size_t axis = 0; axis < n; ++axis) {
        double g = static_cast<double>(grid[axis]);
        wrapped[axis] = std::fmod(std::fmod(coordinates[axis], g) + g, g);
    }

    std::span<const double> point(wrapped.data(), n);
    CornerScalars scalars = evaluateCell(lattice_, point);
    return interpolate(scalars.values(), point);
}

double NoiseField::noise(double x) const {
    return noise(std::span<const double>(&x, 1));
}

double NoiseField::noise(const glm::dvec2& p) const {
    std::array<double, 2> coords = {p.x, p.y};
    return noise(std::span<const double>(coords));
}

double NoiseField::noise(const glm::dvec3& p) const {
    std::array<double, 3> coords = {p.x, p.y, p.z};
    return noise(std::span<const double>(coords));
}

double NoiseField::noise(const glm::dvec4& p) const {
    std::array<double, 4> coords = {p.x, p.y, p.z, p.w};
    return noise(std::span<const double>(coords));
}

}  // namespace ndnoise
