/**
 * @file spot_detector.hpp
 * @brief High-pass filtering followed by single-scale LoG spot detection
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_SPOT_DETECTOR_HPP
#define NUCLEI_SPOTS_SPOT_DETECTOR_HPP

#include <vector>

#include "nuclei_spots/blob_detection.hpp"
#include "nuclei_spots/common.hpp"
#include "nuclei_spots/image.hpp"

namespace nuclei_spots {

/**
 * @struct SpotDetectionParams
 * @brief Parameters for detectSpots()
 */
struct SpotDetectionParams {
    scalar_t high_pass_sigma = DEFAULT_HIGH_PASS_SIGMA; ///< Width of the subtracted Gaussian blur
    scalar_t threshold = DEFAULT_SPOT_THRESHOLD;        ///< Raw cutoff on the filtered LoG response
    scalar_t blob_sigma = DEFAULT_BLOB_SIGMA;           ///< Largest blob scale
    scalar_t min_sigma = DEFAULT_MIN_SIGMA;             ///< Smallest blob scale
    scalar_t overlap = DEFAULT_BLOB_OVERLAP;
    size_t exclude_border = 0;
};

/**
 * @struct SpotDetectionResult
 * @brief Detected spots as index-aligned coordinates and diameters
 *
 * coordinates[i] and sizes[i] describe the same spot.
 */
struct SpotDetectionResult {
    std::vector<Point2D> coordinates;  ///< (row, col) positions
    std::vector<scalar_t> sizes;       ///< Estimated diameters (3 x blob sigma)

    size_t count() const { return coordinates.size(); }
    bool empty() const { return coordinates.empty(); }
};

/**
 * @brief Detect spots in a 2-D image
 *
 * Applies gaussianHighPass() with params.high_pass_sigma, then blobLog()
 * restricted to a single scale (num_sigma = 1, max_sigma = blob_sigma) with
 * the given threshold. A blob of scale sigma becomes a spot of size
 * 3 * sigma. No detections yields two empty sequences.
 *
 * @throws std::invalid_argument for non-2-D input or invalid parameters
 */
SpotDetectionResult detectSpots(const Image& image,
                                const SpotDetectionParams& params = SpotDetectionParams());

/**
 * @brief Same as detectSpots(), also returning the high-pass image
 * @param filtered Receives the filtered image the detector ran on
 */
SpotDetectionResult detectSpots(const Image& image, const SpotDetectionParams& params,
                                Image& filtered);

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_SPOT_DETECTOR_HPP
