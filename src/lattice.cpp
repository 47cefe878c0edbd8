/**
 * @file lattice.cpp
 * @brief Gradient lattice construction and lookup
 */

#include "ndnoise/lattice.hpp"
#include "ndnoise/errors.hpp"

#include <cmath>
#include <limits>
#include <random>
#include <string>

namespace ndnoise {

namespace {

/// Repeatable stream of reals driven only by the seed.
/// mt19937_64 output is fixed by the standard; the distribution step is done
/// by hand so the sequence does not depend on the standard library vendor.
class GradientStream {
public:
    explicit GradientStream(uint64_t seed) : engine_(seed) {}

    /// Uniform in [0, 1) from the top 53 bits of one engine output
    double nextUnit() {
        return static_cast<double>(engine_() >> 11) * 0x1.0p-53;
    }

    /// Uniform in [-1, 1)
    double nextSigned() {
        return -1.0 + 2.0 * nextUnit();
    }

private:
    std::mt19937_64 engine_;
};

/// Normalize in place; a zero vector stays zero
void normalize(std::span<double> v) {
    double sumSq = 0.0;
    for (double c : v) {
        sumSq += c * c;
    }
    if (sumSq == 0.0) {
        for (double& c : v) c = 0.0;
        return;
    }
    double magnitude = std::sqrt(sumSq);
    for (double& c : v) {
        c /= magnitude;
    }
}

/// Total entry count, rejecting shapes whose storage would overflow
size_t entryCount(int dimension, std::span<const int32_t> gridShape) {
    constexpr size_t kLimit = std::numeric_limits<size_t>::max();
    size_t count = 1;
    for (int32_t cells : gridShape) {
        size_t extent = static_cast<size_t>(cells) + 1;
        if (count > kLimit / extent) {
            throw ConfigurationError("Lattice is too large to allocate");
        }
        count *= extent;
    }
    if (count > kLimit / sizeof(double) / static_cast<size_t>(dimension)) {
        throw ConfigurationError("Lattice is too large to allocate");
    }
    return count;
}

}  // namespace

// ============================================================================
// Lattice
// ============================================================================

Lattice::Lattice(int dimension, std::span<const int32_t> gridShape, size_t count)
    : dimension_(dimension)
    , gridShape_(gridShape.begin(), gridShape.end())
    , strides_(static_cast<size_t>(dimension))
    , count_(count)
    , components_(count * static_cast<size_t>(dimension), 0.0)
{
    // Last axis varies fastest
    size_t stride = 1;
    for (int axis = dimension - 1; axis >= 0; --axis) {
        strides_[static_cast<size_t>(axis)] = stride;
        stride *= static_cast<size_t>(gridShape_[static_cast<size_t>(axis)]) + 1;
    }
}

std::optional<size_t> Lattice::indexOf(std::span<const int32_t> coords) const {
    if (coords.size() != static_cast<size_t>(dimension_)) {
        return std::nullopt;
    }
    size_t index = 0;
    for (size_t axis = 0; axis < coords.size(); ++axis) {
        int32_t c = coords[axis];
        if (c < 0 || c > gridShape_[axis]) {
            return std::nullopt;
        }
        index += static_cast<size_t>(c) * strides_[axis];
    }
    return index;
}

bool Lattice::contains(std::span<const int32_t> coords) const {
    return indexOf(coords).has_value();
}

std::optional<Gradient> Lattice::find(std::span<const int32_t> coords) const {
    auto index = indexOf(coords);
    if (!index) {
        return std::nullopt;
    }
    return gradientAt(*index);
}

Gradient Lattice::gradientAt(size_t index) const {
    if (index >= count_) {
        throw LatticeBoundsError("Lattice index " + std::to_string(index) +
                                 " out of range (size " + std::to_string(count_) + ")");
    }
    auto n = static_cast<size_t>(dimension_);
    return Gradient(components_.data() + index * n, n);
}

std::vector<int32_t> Lattice::coordinateAt(size_t index) const {
    if (index >= count_) {
        throw LatticeBoundsError("Lattice index " + std::to_string(index) +
                                 " out of range (size " + std::to_string(count_) + ")");
    }
    std::vector<int32_t> coords(static_cast<size_t>(dimension_));
    for (size_t axis = 0; axis < coords.size(); ++axis) {
        coords[axis] = static_cast<int32_t>(index / strides_[axis]);
        index %= strides_[axis];
    }
    return coords;
}

// ============================================================================
// buildLattice
// ============================================================================

Lattice buildLattice(int dimension, std::span<const int32_t> gridShape, uint64_t seed) {
    if (dimension < 1 || dimension > kMaxDimension) {
        throw ConfigurationError("Dimension must be between 1 and " +
                                 std::to_string(kMaxDimension) + ", got " +
                                 std::to_string(dimension));
    }
    if (gridShape.size() != static_cast<size_t>(dimension)) {
        throw ConfigurationError("Grid shape length (" + std::to_string(gridShape.size()) +
                                 ") must match dimension (" + std::to_string(dimension) + ")");
    }
    for (size_t axis = 0; axis < gridShape.size(); ++axis) {
        if (gridShape[axis] < 0) {
            throw ConfigurationError("Grid shape entry " + std::to_string(axis) +
                                     " must not be negative, got " +
                                     std::to_string(gridShape[axis]));
        }
    }

    Lattice lattice(dimension, gridShape, entryCount(dimension, gridShape));
    GradientStream stream(seed);

    // Storage order is the traversal order, so entry i consumes draws
    // [i*n, (i+1)*n) of the stream.
    auto n = static_cast<size_t>(dimension);
    for (size_t i = 0; i < lattice.count_; ++i) {
        std::span<double> gradient(lattice.components_.data() + i * n, n);
        for (double& c : gradient) {
            c = stream.nextSigned();
        }
        if (dimension >= 2) {
            normalize(gradient);
        }
    }

    return lattice;
}

std::optional<Gradient> lookupGradient(const Lattice& lattice, std::span<const int32_t> coords) {
    return lattice.find(coords);
}

}  // namespace ndnoise
