/**
 * @file regions.hpp
 * @brief Per-label region measurements on nucleus label maps
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_REGIONS_HPP
#define NUCLEI_SPOTS_REGIONS_HPP

#include <cstddef>
#include <map>
#include <vector>

#include "nuclei_spots/common.hpp"
#include "nuclei_spots/image.hpp"

namespace nuclei_spots {

/**
 * @struct BoundingBox
 * @brief Half-open pixel bounds [min, max)
 */
struct BoundingBox {
    size_t min_row;
    size_t min_col;
    size_t max_row;
    size_t max_col;
};

/**
 * @struct RegionProperties
 * @brief Measurements of one labeled region
 */
struct RegionProperties {
    label_t label;
    size_t area;          ///< Pixel count
    Point2D centroid;     ///< Mean (row, col) of the region's pixels
    BoundingBox bbox;
};

/// Nucleus label -> centroid, ordered by label
using CentroidTable = std::map<label_t, Point2D>;

/**
 * @brief Measure every positive label of a 2-D label map
 * @return One entry per label, ascending label order
 * @throws std::invalid_argument for non-2-D maps or negative labels
 */
std::vector<RegionProperties> regionProperties(const LabelMap& labels);

/**
 * @brief Centroid of every positive label
 */
CentroidTable regionCentroids(const LabelMap& labels);

/**
 * @brief Centroid table from measured regions
 */
CentroidTable centroidTable(const std::vector<RegionProperties>& regions);

/**
 * @brief Label map value under each point
 *
 * Points are rounded to the nearest pixel; points outside the map give the
 * background label.
 */
std::vector<label_t> labelsAtPoints(const LabelMap& labels, const std::vector<Point2D>& points);

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_REGIONS_HPP
