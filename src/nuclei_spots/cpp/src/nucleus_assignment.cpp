/**
 * @file nucleus_assignment.cpp
 * @brief Nearest-centroid assignment of spots to nuclei
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/nucleus_assignment.hpp"
#include "nuclei_spots/kd_tree.hpp"

#include <stdexcept>
#include <utility>

namespace nuclei_spots {

SpotAssignment assignSpotsToNuclei(const std::vector<Point2D>& spots,
                                   const CentroidTable& centroids)
{
    if (centroids.empty()) {
        throw std::invalid_argument(
            "assignSpotsToNuclei: empty index, the nucleus centroid set is empty");
    }

    // CentroidTable iterates in ascending label order, so the tree's
    // lowest-index tie-break is a lowest-label tie-break.
    std::vector<label_t> index_labels;
    std::vector<Point2D> points;
    index_labels.reserve(centroids.size());
    points.reserve(centroids.size());
    for (const auto& entry : centroids) {
        index_labels.push_back(entry.first);
        points.push_back(entry.second);
    }

    const KDTree tree(std::move(points));

    SpotAssignment assignment;
    assignment.labels.reserve(spots.size());
    assignment.distances.reserve(spots.size());
    for (const Point2D& spot : spots) {
        const Neighbor nn = tree.nearest(spot);
        assignment.labels.push_back(index_labels[nn.index]);
        assignment.distances.push_back(nn.distance);
    }
    return assignment;
}

std::map<label_t, size_t> countSpotsPerNucleus(const SpotAssignment& assignment,
                                               const CentroidTable& centroids)
{
    std::map<label_t, size_t> counts;
    for (const auto& entry : centroids) {
        counts[entry.first] = 0;
    }
    for (label_t label : assignment.labels) {
        ++counts[label];
    }
    return counts;
}

} // namespace nuclei_spots
