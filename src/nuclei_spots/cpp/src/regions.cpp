/**
 * @file regions.cpp
 * @brief Region measurements (area, centroid, bounding box)
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/regions.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace nuclei_spots {

namespace {

struct Accumulator {
    size_t area = 0;
    double sum_row = 0.0;
    double sum_col = 0.0;
    BoundingBox bbox{0, 0, 0, 0};
};

} // namespace

std::vector<RegionProperties> regionProperties(const LabelMap& labels) {
    requireImage2D(labels.shape(), "regionProperties");

    std::map<label_t, Accumulator> acc;
    const size_t rows = labels.rows();
    const size_t cols = labels.cols();

    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            const label_t label = labels(r, c);
            if (label == BACKGROUND_LABEL) continue;
            if (label < 0) {
                throw std::invalid_argument("regionProperties: negative label " +
                                            std::to_string(label) + " at (" +
                                            std::to_string(r) + ", " + std::to_string(c) + ")");
            }

            Accumulator& a = acc[label];
            if (a.area == 0) {
                a.bbox = BoundingBox{r, c, r + 1, c + 1};
            } else {
                a.bbox.min_row = std::min(a.bbox.min_row, r);
                a.bbox.min_col = std::min(a.bbox.min_col, c);
                a.bbox.max_row = std::max(a.bbox.max_row, r + 1);
                a.bbox.max_col = std::max(a.bbox.max_col, c + 1);
            }
            ++a.area;
            a.sum_row += static_cast<double>(r);
            a.sum_col += static_cast<double>(c);
        }
    }

    std::vector<RegionProperties> regions;
    regions.reserve(acc.size());
    for (const auto& entry : acc) {
        const Accumulator& a = entry.second;
        RegionProperties props;
        props.label = entry.first;
        props.area = a.area;
        props.centroid = Point2D(a.sum_row / a.area, a.sum_col / a.area);
        props.bbox = a.bbox;
        regions.push_back(props);
    }
    return regions;
}

CentroidTable centroidTable(const std::vector<RegionProperties>& regions) {
    CentroidTable table;
    for (const RegionProperties& region : regions) {
        table[region.label] = region.centroid;
    }
    return table;
}

CentroidTable regionCentroids(const LabelMap& labels) {
    return centroidTable(regionProperties(labels));
}

std::vector<label_t> labelsAtPoints(const LabelMap& labels, const std::vector<Point2D>& points) {
    requireImage2D(labels.shape(), "labelsAtPoints");

    std::vector<label_t> out;
    out.reserve(points.size());
    const double rows = static_cast<double>(labels.rows());
    const double cols = static_cast<double>(labels.cols());

    for (const Point2D& p : points) {
        const double r = std::round(p.row);
        const double c = std::round(p.col);
        if (!std::isfinite(r) || !std::isfinite(c) || r < 0 || c < 0 || r >= rows || c >= cols) {
            out.push_back(BACKGROUND_LABEL);
        } else {
            out.push_back(labels(static_cast<size_t>(r), static_cast<size_t>(c)));
        }
    }
    return out;
}

} // namespace nuclei_spots
