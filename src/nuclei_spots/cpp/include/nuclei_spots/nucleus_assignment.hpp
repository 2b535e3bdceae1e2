/**
 * @file nucleus_assignment.hpp
 * @brief Assignment of detected spots to their nearest nucleus
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_NUCLEUS_ASSIGNMENT_HPP
#define NUCLEI_SPOTS_NUCLEUS_ASSIGNMENT_HPP

#include <map>
#include <vector>

#include "nuclei_spots/common.hpp"
#include "nuclei_spots/regions.hpp"

namespace nuclei_spots {

/**
 * @struct SpotAssignment
 * @brief Nearest nucleus of every spot, index-aligned with the spot list
 */
struct SpotAssignment {
    std::vector<label_t> labels;      ///< Label of the nearest centroid
    std::vector<scalar_t> distances;  ///< Euclidean distance to that centroid

    size_t size() const { return labels.size(); }
};

/**
 * @brief Assign each spot to the nucleus with the nearest centroid
 *
 * A k-d tree over the centroids is built for this call and discarded after
 * it. When a spot is equidistant from several centroids the lowest label
 * wins.
 *
 * @param spots Spot coordinates (row, col)
 * @param centroids Nucleus centroid table
 * @throws std::invalid_argument if the centroid table is empty
 */
SpotAssignment assignSpotsToNuclei(const std::vector<Point2D>& spots,
                                   const CentroidTable& centroids);

/**
 * @brief Number of spots assigned to each nucleus
 *
 * Every label of the centroid table appears in the result, including nuclei
 * without spots.
 */
std::map<label_t, size_t> countSpotsPerNucleus(const SpotAssignment& assignment,
                                               const CentroidTable& centroids);

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_NUCLEUS_ASSIGNMENT_HPP
