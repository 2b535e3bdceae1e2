/**
 * @file common.hpp
 * @brief Common types and constants for the nuclei/spots analysis library
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_COMMON_HPP
#define NUCLEI_SPOTS_COMMON_HPP

#include <cstdint>
#include <cmath>
#include <vector>

#define NUCLEI_SPOTS_VERSION "1.0.0"

namespace nuclei_spots {

using scalar_t = double;   // Intensity samples and coordinates
using label_t = int32_t;   // Nucleus label (0 = background)
using index_t = int64_t;   // Flat array indexing

// Default pipeline parameters
constexpr scalar_t DEFAULT_HIGH_PASS_SIGMA = 2.0;
constexpr scalar_t DEFAULT_SPOT_THRESHOLD = 0.01;
constexpr scalar_t DEFAULT_BLOB_SIGMA = 2.0;
constexpr scalar_t DEFAULT_MIN_SIGMA = 1.0;
constexpr scalar_t DEFAULT_BLOB_OVERLAP = 0.5;
constexpr scalar_t DEFAULT_TRUNCATE = 4.0;

// Blob scale (sigma) to spot diameter
constexpr scalar_t SPOT_SIZE_FACTOR = 3.0;

constexpr label_t BACKGROUND_LABEL = 0;

/**
 * @struct Point2D
 * @brief Point in image index space (row, column)
 */
struct Point2D {
    scalar_t row;
    scalar_t col;

    Point2D() : row(0), col(0) {}
    Point2D(scalar_t r, scalar_t c) : row(r), col(c) {}

    scalar_t distanceSquared(const Point2D& other) const {
        scalar_t dr = row - other.row;
        scalar_t dc = col - other.col;
        return dr * dr + dc * dc;
    }

    scalar_t distance(const Point2D& other) const {
        return std::sqrt(distanceSquared(other));
    }

    bool operator==(const Point2D& other) const {
        return row == other.row && col == other.col;
    }
};

/**
 * @brief Library version string
 */
inline const char* version() { return NUCLEI_SPOTS_VERSION; }

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_COMMON_HPP
