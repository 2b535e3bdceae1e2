/**
 * @file blob_detection.cpp
 * @brief Implementation of the Laplacian-of-Gaussian blob detector
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/blob_detection.hpp"
#include "nuclei_spots/filters.hpp"
#include "nuclei_spots/kd_tree.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace nuclei_spots {

namespace {

struct Peak {
    size_t row;
    size_t col;
    size_t scale;
    scalar_t value;
};

void validateParams(const BlobLogParams& params) {
    if (!(params.min_sigma > 0.0) || !std::isfinite(params.min_sigma)) {
        throw std::invalid_argument("blobLog: min_sigma must be a positive finite number");
    }
    if (!(params.max_sigma > 0.0) || !std::isfinite(params.max_sigma)) {
        throw std::invalid_argument("blobLog: max_sigma must be a positive finite number");
    }
    if (params.num_sigma < 1) {
        throw std::invalid_argument("blobLog: num_sigma must be at least 1");
    }
    if (!std::isfinite(params.threshold)) {
        throw std::invalid_argument("blobLog: threshold must be finite");
    }
    if (params.overlap < 0.0 || params.overlap > 1.0) {
        throw std::invalid_argument("blobLog: overlap must lie in [0, 1], got " +
                                    std::to_string(params.overlap));
    }
}

// Area of the lens shared by two disks at distance d, relative to the smaller disk
scalar_t diskOverlap(scalar_t d, scalar_t r1, scalar_t r2) {
    scalar_t ratio1 = (d * d + r1 * r1 - r2 * r2) / (2 * d * r1);
    ratio1 = std::max<scalar_t>(-1.0, std::min<scalar_t>(1.0, ratio1));
    const scalar_t acos1 = std::acos(ratio1);

    scalar_t ratio2 = (d * d + r2 * r2 - r1 * r1) / (2 * d * r2);
    ratio2 = std::max<scalar_t>(-1.0, std::min<scalar_t>(1.0, ratio2));
    const scalar_t acos2 = std::acos(ratio2);

    const scalar_t a = -d + r2 + r1;
    const scalar_t b = d - r2 + r1;
    const scalar_t c = d + r2 - r1;
    const scalar_t e = d + r2 + r1;
    const scalar_t area = r1 * r1 * acos1 + r2 * r2 * acos2 - 0.5 * std::sqrt(std::abs(a * b * c * e));

    const scalar_t rmin = std::min(r1, r2);
    return area / (M_PI * rmin * rmin);
}

std::vector<Image> responseVolume(const Image& image, const std::vector<scalar_t>& scales) {
    std::vector<Image> volume;
    volume.reserve(scales.size());
    for (scalar_t s : scales) {
        Image response = gaussianLaplace(image, s);
        const scalar_t norm = -s * s;
        for (scalar_t& v : response.values()) {
            v *= norm;
        }
        volume.push_back(std::move(response));
    }
    return volume;
}

// Local maxima of the (row, col, scale) volume; neighbors past the edges are clamped
std::vector<Peak> findPeaks(const std::vector<Image>& volume, const BlobLogParams& params) {
    const size_t nscales = volume.size();
    const size_t rows = volume[0].rows();
    const size_t cols = volume[0].cols();

    std::vector<Peak> candidates;
    bool all_maxima = true;

    for (size_t r = 0; r < rows; ++r) {
        const size_t r0 = r > 0 ? r - 1 : 0;
        const size_t r1 = std::min(r + 1, rows - 1);
        for (size_t c = 0; c < cols; ++c) {
            const size_t c0 = c > 0 ? c - 1 : 0;
            const size_t c1 = std::min(c + 1, cols - 1);
            for (size_t k = 0; k < nscales; ++k) {
                const size_t k0 = k > 0 ? k - 1 : 0;
                const size_t k1 = std::min(k + 1, nscales - 1);
                const scalar_t v = volume[k](r, c);

                bool is_max = true;
                for (size_t kk = k0; kk <= k1 && is_max; ++kk) {
                    const Image& plane = volume[kk];
                    for (size_t rr = r0; rr <= r1 && is_max; ++rr) {
                        for (size_t cc = c0; cc <= c1; ++cc) {
                            if (plane(rr, cc) > v) {
                                is_max = false;
                                break;
                            }
                        }
                    }
                }

                if (!is_max) {
                    all_maxima = false;
                    continue;
                }
                candidates.push_back(Peak{r, c, k, v});
            }
        }
    }

    // A flat response has no peaks
    if (all_maxima) {
        return {};
    }

    const size_t border = params.exclude_border;
    std::vector<Peak> peaks;
    for (const Peak& p : candidates) {
        if (!(p.value > params.threshold)) continue;
        if (border > 0) {
            if (p.row < border || p.col < border ||
                p.row + border >= rows || p.col + border >= cols) {
                continue;
            }
        }
        peaks.push_back(p);
    }

    std::stable_sort(peaks.begin(), peaks.end(),
                     [](const Peak& a, const Peak& b) { return a.value > b.value; });
    return peaks;
}

std::vector<Blob> pruneBlobs(std::vector<Blob> blobs, scalar_t overlap) {
    if (blobs.size() < 2) {
        return blobs;
    }

    scalar_t max_sigma = 0.0;
    std::vector<Point2D> centers;
    centers.reserve(blobs.size());
    for (const Blob& b : blobs) {
        max_sigma = std::max(max_sigma, b.sigma);
        centers.emplace_back(b.row, b.col);
    }

    KDTree tree(std::move(centers));
    const scalar_t reach = 2.0 * max_sigma * std::sqrt(2.0);

    for (const auto& pair : tree.queryPairs(reach)) {
        Blob& a = blobs[pair.first];
        Blob& b = blobs[pair.second];
        if (blobOverlap(a, b) > overlap) {
            // Blobs are ordered by descending response, so on equal scales b is the weaker one
            if (a.sigma >= b.sigma) {
                b.sigma = 0.0;
            } else {
                a.sigma = 0.0;
            }
        }
    }

    blobs.erase(std::remove_if(blobs.begin(), blobs.end(),
                               [](const Blob& b) { return !(b.sigma > 0.0); }),
                blobs.end());
    return blobs;
}

} // namespace

std::vector<scalar_t> blobScales(const BlobLogParams& params) {
    validateParams(params);
    if (params.num_sigma == 1) {
        return {params.min_sigma};
    }
    std::vector<scalar_t> scales(params.num_sigma);
    const scalar_t step = (params.max_sigma - params.min_sigma) /
                          static_cast<scalar_t>(params.num_sigma - 1);
    for (size_t i = 0; i < params.num_sigma; ++i) {
        scales[i] = params.min_sigma + step * static_cast<scalar_t>(i);
    }
    scales.back() = params.max_sigma;
    return scales;
}

scalar_t blobOverlap(const Blob& a, const Blob& b) {
    if (a.sigma <= 0.0 && b.sigma <= 0.0) {
        return 0.0;
    }

    // Rescale space so the larger blob has radius 1
    const scalar_t large = std::max(a.sigma, b.sigma);
    const scalar_t r1 = a.sigma / large;
    const scalar_t r2 = b.sigma / large;

    const scalar_t unit = large * std::sqrt(2.0);
    const scalar_t dr = (a.row - b.row) / unit;
    const scalar_t dc = (a.col - b.col) / unit;
    const scalar_t d = std::sqrt(dr * dr + dc * dc);

    if (d > r1 + r2) {
        return 0.0;
    }
    if (d <= std::abs(r1 - r2)) {
        return 1.0;
    }
    return diskOverlap(d, r1, r2);
}

std::vector<Blob> blobLog(const Image& image, const BlobLogParams& params) {
    requireImage2D(image.shape(), "blobLog");
    const std::vector<scalar_t> scales = blobScales(params);

    const std::vector<Image> volume = responseVolume(image, scales);
    const std::vector<Peak> peaks = findPeaks(volume, params);

    std::vector<Blob> blobs;
    blobs.reserve(peaks.size());
    for (const Peak& p : peaks) {
        blobs.push_back(Blob{static_cast<scalar_t>(p.row), static_cast<scalar_t>(p.col),
                             scales[p.scale], p.value});
    }

    return pruneBlobs(std::move(blobs), params.overlap);
}

} // namespace nuclei_spots
