/**
 * @file image.cpp
 * @brief Raster helpers (projection, arithmetic, shape checks)
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/image.hpp"

#include <algorithm>
#include <stdexcept>

namespace nuclei_spots {

Image maxProjection(const Image& stack) {
    if (stack.ndim() == 2) {
        return stack;
    }
    if (stack.ndim() != 3 || stack.empty()) {
        throw std::invalid_argument("maxProjection expects a non-empty 3-D stack, got shape " +
                                    Image::shapeToString(stack.shape()));
    }

    const size_t planes = stack.shape(0);
    const size_t plane_len = stack.rows() * stack.cols();

    Image out(stack.rows(), stack.cols());
    std::copy(stack.data(), stack.data() + plane_len, out.data());

    for (size_t z = 1; z < planes; ++z) {
        const scalar_t* src = stack.data() + z * plane_len;
        scalar_t* dst = out.data();
        for (size_t i = 0; i < plane_len; ++i) {
            dst[i] = std::max(dst[i], src[i]);
        }
    }
    return out;
}

Image subtract(const Image& a, const Image& b) {
    if (!a.sameShape(b)) {
        throw std::invalid_argument("Shape mismatch: " + Image::shapeToString(a.shape()) +
                                    " vs " + Image::shapeToString(b.shape()));
    }
    Image out(a.shape());
    const scalar_t* pa = a.data();
    const scalar_t* pb = b.data();
    scalar_t* po = out.data();
    for (size_t i = 0; i < a.size(); ++i) {
        po[i] = pa[i] - pb[i];
    }
    return out;
}

void requireImage2D(const std::vector<size_t>& shape, const std::string& operation) {
    if (shape.size() != 2) {
        throw std::invalid_argument(operation + " requires a 2-D image, got shape " +
                                    Image::shapeToString(shape));
    }
    if (shape[0] == 0 || shape[1] == 0) {
        throw std::invalid_argument(operation + " requires a non-empty image, got shape " +
                                    Image::shapeToString(shape));
    }
}

} // namespace nuclei_spots
