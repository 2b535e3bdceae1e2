/**
 * @file blob_detection.hpp
 * @brief Laplacian-of-Gaussian blob detection on 2-D images
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_BLOB_DETECTION_HPP
#define NUCLEI_SPOTS_BLOB_DETECTION_HPP

#include <cstddef>
#include <vector>

#include "nuclei_spots/common.hpp"
#include "nuclei_spots/image.hpp"

namespace nuclei_spots {

/**
 * @struct Blob
 * @brief Detected blob: position in index space and Gaussian scale
 */
struct Blob {
    scalar_t row;
    scalar_t col;
    scalar_t sigma;
    scalar_t response;  ///< Scale-normalized LoG response at the peak
};

/**
 * @struct BlobLogParams
 * @brief Parameters of the multi-scale LoG detector
 */
struct BlobLogParams {
    scalar_t min_sigma = DEFAULT_MIN_SIGMA;    ///< Smallest scale examined
    scalar_t max_sigma = DEFAULT_BLOB_SIGMA;   ///< Largest scale examined
    size_t num_sigma = 1;                      ///< Scales evenly spaced in [min_sigma, max_sigma]
    scalar_t threshold = DEFAULT_SPOT_THRESHOLD; ///< Absolute lower bound on the response
    scalar_t overlap = DEFAULT_BLOB_OVERLAP;   ///< Overlap fraction above which the smaller blob is dropped
    size_t exclude_border = 0;                 ///< Reject peaks closer than this to the image edge
};

/**
 * @brief Scales examined by the detector
 *
 * Evenly spaced from min_sigma to max_sigma inclusive. A single scale is
 * min_sigma.
 */
std::vector<scalar_t> blobScales(const BlobLogParams& params);

/**
 * @brief Fraction of the smaller blob's disk covered by the other blob
 *
 * Each blob is a disk of radius sigma * sqrt(2).
 *
 * @return Value in [0, 1]
 */
scalar_t blobOverlap(const Blob& a, const Blob& b);

/**
 * @brief Detect bright blobs with the Laplacian of Gaussian
 *
 * For every scale s the response -s^2 * LoG(image, s) is computed; blobs are
 * local maxima of the (row, col, scale) response volume in a 3x3x3
 * neighborhood that exceed the threshold. Peaks are returned by descending
 * response, after removal of blobs overlapping a larger (or, for equal
 * scales, a stronger) blob by more than params.overlap.
 *
 * @param image 2-D floating-point image
 * @param params Detector parameters
 * @throws std::invalid_argument for non-2-D input or invalid parameters
 */
std::vector<Blob> blobLog(const Image& image, const BlobLogParams& params = BlobLogParams());

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_BLOB_DETECTION_HPP
