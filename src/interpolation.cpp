/**
 * @file interpolation.cpp
 * @brief Multilinear smoothstep reduction over a hypercube cell
 */

#include "ndnoise/interpolation.hpp"
#include "ndnoise/errors.hpp"
#include "ndnoise/lattice.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace ndnoise {

double smoothstep(double t) {
    double c = std::clamp(t, 0.0, 1.0);
    return c * c * (3.0 - 2.0 * c);
}

std::vector<double> fractionalCoordinates(std::span<const double> point) {
    std::vector<double> frac;
    frac.reserve(point.size());
    for (double c : point) {
        frac.push_back(c - std::floor(c));
    }
    return frac;
}

double interpolate1D(double a0, double a1, double t) {
    return a0 + smoothstep(t) * (a1 - a0);
}

double interpolate(std::span<const double> cornerScalars, std::span<const double> point) {
    const size_t n = point.size();
    if (n == 0 || n > static_cast<size_t>(kMaxDimension)) {
        throw ConfigurationError("Point dimension must be between 1 and " +
                                 std::to_string(kMaxDimension) + ", got " +
                                 std::to_string(n));
    }
    const size_t expected = size_t{1} << n;
    if (cornerScalars.size() != expected) {
        throw ConfigurationError("The number of scalar values (" +
                                 std::to_string(cornerScalars.size()) +
                                 ") must be equal to 2^" + std::to_string(n) + " = " +
                                 std::to_string(expected));
    }

    std::array<double, kMaxCorners> buffer;
    std::copy(cornerScalars.begin(), cornerScalars.end(), buffer.begin());

    // Pairs (2i, 2i+1) differ only in the lowest remaining axis bit. After
    // each pass entry i holds the blend for the corners whose remaining bits
    // are i, so the next axis again sits in bit 0.
    size_t count = expected;
    for (size_t axis = 0; axis < n; ++axis) {
        double t = point[axis] - std::floor(point[axis]);
        count /= 2;
        for (size_t i = 0; i < count; ++i) {
            buffer[i] = interpolate1D(buffer[2 * i], buffer[2 * i + 1], t);
        }
    }

    return buffer[0];
}

}  // namespace ndnoise
