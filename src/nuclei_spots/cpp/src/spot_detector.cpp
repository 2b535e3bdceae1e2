/**
 * @file spot_detector.cpp
 * @brief Spot detection on high-pass filtered images
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/spot_detector.hpp"
#include "nuclei_spots/filters.hpp"

namespace nuclei_spots {

SpotDetectionResult detectSpots(const Image& image, const SpotDetectionParams& params,
                                Image& filtered)
{
    requireImage2D(image.shape(), "detectSpots");

    filtered = gaussianHighPass(image, params.high_pass_sigma);

    BlobLogParams blob_params;
    blob_params.min_sigma = params.min_sigma;
    blob_params.max_sigma = params.blob_sigma;
    blob_params.num_sigma = 1;
    blob_params.threshold = params.threshold;
    blob_params.overlap = params.overlap;
    blob_params.exclude_border = params.exclude_border;

    const std::vector<Blob> blobs = blobLog(filtered, blob_params);

    SpotDetectionResult result;
    result.coordinates.reserve(blobs.size());
    result.sizes.reserve(blobs.size());
    for (const Blob& b : blobs) {
        result.coordinates.emplace_back(b.row, b.col);
        result.sizes.push_back(SPOT_SIZE_FACTOR * b.sigma);
    }
    return result;
}

SpotDetectionResult detectSpots(const Image& image, const SpotDetectionParams& params) {
    Image filtered;
    return detectSpots(image, params, filtered);
}

} // namespace nuclei_spots
