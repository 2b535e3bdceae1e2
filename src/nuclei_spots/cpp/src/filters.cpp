/**
 * @file filters.cpp
 * @brief CPU implementation of separable Gaussian filters
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/filters.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace nuclei_spots {

namespace {

void validateSigma(scalar_t sigma, const char* operation) {
    if (!(sigma > 0.0) || !std::isfinite(sigma)) {
        throw std::invalid_argument(std::string(operation) +
                                    ": sigma must be a positive finite number, got " +
                                    std::to_string(sigma));
    }
}

// Half-sample symmetric extension: d c b a | a b c d | d c b a
inline index_t reflectIndex(index_t i, index_t n) {
    if (n == 1) return 0;
    const index_t period = 2 * n;
    i %= period;
    if (i < 0) i += period;
    if (i >= n) i = period - 1 - i;
    return i;
}

std::vector<scalar_t> reversed(std::vector<scalar_t> kernel) {
    std::reverse(kernel.begin(), kernel.end());
    return kernel;
}

} // namespace

std::vector<scalar_t> gaussianKernel1D(scalar_t sigma, int order, scalar_t truncate) {
    validateSigma(sigma, "gaussianKernel1D");
    if (order < 0) {
        throw std::invalid_argument("gaussianKernel1D: derivative order must be >= 0");
    }
    if (!(truncate > 0.0)) {
        throw std::invalid_argument("gaussianKernel1D: truncate must be positive");
    }

    const int radius = static_cast<int>(truncate * sigma + 0.5);
    const scalar_t sigma2 = sigma * sigma;
    const size_t len = static_cast<size_t>(2 * radius + 1);

    std::vector<scalar_t> phi(len);
    scalar_t sum = 0.0;
    for (int x = -radius; x <= radius; ++x) {
        scalar_t v = std::exp(-0.5 / sigma2 * x * x);
        phi[x + radius] = v;
        sum += v;
    }
    for (scalar_t& v : phi) {
        v /= sum;
    }
    if (order == 0) {
        return phi;
    }

    // The n-th derivative of phi is q_n(x) * phi(x) with q_n a polynomial:
    // q_{n+1} = q_n' - x / sigma^2 * q_n
    std::vector<scalar_t> q(order + 1, 0.0);
    q[0] = 1.0;
    for (int n = 0; n < order; ++n) {
        std::vector<scalar_t> next(order + 1, 0.0);
        for (int i = 0; i <= order; ++i) {
            scalar_t v = 0.0;
            if (i + 1 <= order) v += (i + 1) * q[i + 1];
            if (i >= 1) v -= q[i - 1] / sigma2;
            next[i] = v;
        }
        q.swap(next);
    }

    std::vector<scalar_t> kernel(len);
    for (int x = -radius; x <= radius; ++x) {
        scalar_t poly = 0.0;
        scalar_t xp = 1.0;
        for (int i = 0; i <= order; ++i) {
            poly += q[i] * xp;
            xp *= x;
        }
        kernel[x + radius] = poly * phi[x + radius];
    }
    return kernel;
}

Image correlateAxis(const Image& image, size_t axis, const std::vector<scalar_t>& kernel) {
    if (axis >= image.ndim()) {
        throw std::invalid_argument("correlateAxis: axis " + std::to_string(axis) +
                                    " out of range for shape " +
                                    Image::shapeToString(image.shape()));
    }
    if (kernel.empty() || kernel.size() % 2 == 0) {
        throw std::invalid_argument("correlateAxis: kernel length must be odd");
    }

    Image out(image.shape());
    if (image.empty()) {
        return out;
    }

    const index_t n = static_cast<index_t>(image.shape(axis));
    const size_t stride = image.stride(axis);
    const size_t outer = image.size() / (static_cast<size_t>(n) * stride);
    const index_t radius = static_cast<index_t>(kernel.size() / 2);
    const index_t klen = static_cast<index_t>(kernel.size());

    std::vector<scalar_t> line(static_cast<size_t>(n + 2 * radius));
    const scalar_t* src = image.data();
    scalar_t* dst = out.data();

    for (size_t o = 0; o < outer; ++o) {
        for (size_t i = 0; i < stride; ++i) {
            const size_t base = o * static_cast<size_t>(n) * stride + i;

            for (index_t k = -radius; k < n + radius; ++k) {
                line[k + radius] = src[base + static_cast<size_t>(reflectIndex(k, n)) * stride];
            }

            for (index_t k = 0; k < n; ++k) {
                scalar_t acc = 0.0;
                const scalar_t* p = &line[k];
                for (index_t j = 0; j < klen; ++j) {
                    acc += kernel[j] * p[j];
                }
                dst[base + static_cast<size_t>(k) * stride] = acc;
            }
        }
    }
    return out;
}

Image gaussianFilter(const Image& image, scalar_t sigma, scalar_t truncate) {
    validateSigma(sigma, "gaussianFilter");
    const std::vector<scalar_t> weights = reversed(gaussianKernel1D(sigma, 0, truncate));

    Image result = image;
    for (size_t axis = 0; axis < image.ndim(); ++axis) {
        result = correlateAxis(result, axis, weights);
    }
    return result;
}

Image gaussianLaplace(const Image& image, scalar_t sigma, scalar_t truncate) {
    validateSigma(sigma, "gaussianLaplace");
    const std::vector<scalar_t> smooth = reversed(gaussianKernel1D(sigma, 0, truncate));
    const std::vector<scalar_t> second = reversed(gaussianKernel1D(sigma, 2, truncate));

    Image total(image.shape(), 0.0);
    for (size_t deriv_axis = 0; deriv_axis < image.ndim(); ++deriv_axis) {
        Image term = image;
        for (size_t axis = 0; axis < image.ndim(); ++axis) {
            term = correlateAxis(term, axis, axis == deriv_axis ? second : smooth);
        }
        scalar_t* t = total.data();
        const scalar_t* p = term.data();
        for (size_t i = 0; i < total.size(); ++i) {
            t[i] += p[i];
        }
    }
    return total;
}

Image gaussianHighPass(const Image& image, scalar_t sigma) {
    validateSigma(sigma, "gaussianHighPass");
    Image lowpass = gaussianFilter(image, sigma);
    return subtract(image, lowpass);
}

} // namespace nuclei_spots
