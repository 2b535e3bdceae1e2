/**
 * @file filters.hpp
 * @brief Separable Gaussian filtering: low-pass, high-pass and Laplacian of Gaussian
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_FILTERS_HPP
#define NUCLEI_SPOTS_FILTERS_HPP

#include <vector>

#include "nuclei_spots/common.hpp"
#include "nuclei_spots/image.hpp"

namespace nuclei_spots {

/**
 * @brief Sampled 1-D Gaussian kernel or one of its derivatives
 *
 * The kernel spans [-radius, radius] with radius = int(truncate * sigma + 0.5)
 * and is normalized so the order-0 weights sum to one.
 *
 * @param sigma Standard deviation (> 0)
 * @param order Derivative order (0 = smoothing, 1 = first, 2 = second)
 * @param truncate Kernel half-width in units of sigma
 * @return Kernel weights, length 2 * radius + 1
 */
std::vector<scalar_t> gaussianKernel1D(scalar_t sigma, int order = 0,
                                       scalar_t truncate = DEFAULT_TRUNCATE);

/**
 * @brief Correlate every line along one axis with a 1-D kernel
 *
 * Samples past the edges are mirrored about the half-sample boundary
 * (d c b a | a b c d | d c b a).
 */
Image correlateAxis(const Image& image, size_t axis, const std::vector<scalar_t>& kernel);

/**
 * @brief Gaussian low-pass filter along every axis
 * @param image Input of any dimensionality
 * @param sigma Standard deviation in pixels (> 0)
 * @param truncate Kernel half-width in units of sigma
 * @throws std::invalid_argument if sigma is not a positive finite number
 */
Image gaussianFilter(const Image& image, scalar_t sigma, scalar_t truncate = DEFAULT_TRUNCATE);

/**
 * @brief Laplacian of Gaussian (sum of second derivatives along each axis)
 */
Image gaussianLaplace(const Image& image, scalar_t sigma, scalar_t truncate = DEFAULT_TRUNCATE);

/**
 * @brief High-pass filter: image minus its Gaussian-blurred copy
 *
 * The result has the same shape as the input and may contain negative values.
 *
 * @param image Input of any dimensionality
 * @param sigma Width of the Gaussian used for the low-pass estimate (> 0)
 */
Image gaussianHighPass(const Image& image, scalar_t sigma = DEFAULT_HIGH_PASS_SIGMA);

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_FILTERS_HPP
