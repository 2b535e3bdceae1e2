/**
 * @file image.hpp
 * @brief Dense N-dimensional raster containers for intensity images and label maps
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_IMAGE_HPP
#define NUCLEI_SPOTS_IMAGE_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "nuclei_spots/common.hpp"

namespace nuclei_spots {

/**
 * @class Raster
 * @brief Row-major N-dimensional array with an explicit shape
 *
 * The last axis is contiguous. 2-D rasters are addressed as (row, col),
 * 3-D rasters as (plane, row, col).
 */
template <typename T>
class Raster {
public:
    using value_type = T;

    Raster() = default;

    /**
     * @brief Construct a raster of the given shape filled with a value
     * @param shape Extent of each axis (outermost first)
     * @param fill Initial value of every sample
     */
    explicit Raster(std::vector<size_t> shape, T fill = T())
        : shape_(std::move(shape)),
          data_(countElements(shape_), fill)
    {
    }

    Raster(size_t rows, size_t cols, T fill = T())
        : Raster(std::vector<size_t>{rows, cols}, fill)
    {
    }

    /**
     * @brief Wrap existing samples into a raster
     * @throws std::invalid_argument if the sample count does not match the shape
     */
    static Raster fromData(std::vector<size_t> shape, std::vector<T> data) {
        if (countElements(shape) != data.size()) {
            throw std::invalid_argument(
                "Sample count " + std::to_string(data.size()) +
                " does not match shape " + shapeToString(shape));
        }
        Raster r;
        r.shape_ = std::move(shape);
        r.data_ = std::move(data);
        return r;
    }

    size_t ndim() const { return shape_.size(); }
    const std::vector<size_t>& shape() const { return shape_; }
    size_t shape(size_t axis) const { return shape_.at(axis); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }
    bool is2D() const { return shape_.size() == 2; }

    size_t rows() const { return shape_.size() >= 2 ? shape_[shape_.size() - 2] : 0; }
    size_t cols() const { return shape_.empty() ? 0 : shape_.back(); }

    T* data() { return data_.data(); }
    const T* data() const { return data_.data(); }
    std::vector<T>& values() { return data_; }
    const std::vector<T>& values() const { return data_; }

    /**
     * @brief Distance in samples between neighbors along an axis
     */
    size_t stride(size_t axis) const {
        size_t s = 1;
        for (size_t a = axis + 1; a < shape_.size(); ++a) {
            s *= shape_[a];
        }
        return s;
    }

    T& operator()(size_t row, size_t col) { return data_[row * cols() + col]; }
    const T& operator()(size_t row, size_t col) const { return data_[row * cols() + col]; }

    T& operator()(size_t plane, size_t row, size_t col) {
        return data_[(plane * rows() + row) * cols() + col];
    }
    const T& operator()(size_t plane, size_t row, size_t col) const {
        return data_[(plane * rows() + row) * cols() + col];
    }

    bool sameShape(const Raster& other) const { return shape_ == other.shape_; }

    /**
     * @brief Copy one plane out of a 3-D raster
     */
    Raster plane(size_t z) const {
        if (ndim() != 3) {
            throw std::invalid_argument("plane() requires a 3-D raster, got shape " +
                                        shapeToString(shape_));
        }
        if (z >= shape_[0]) {
            throw std::out_of_range("Plane index " + std::to_string(z) + " outside raster of shape " +
                                    shapeToString(shape_));
        }
        Raster out(rows(), cols());
        const size_t plane_len = rows() * cols();
        std::copy(data_.begin() + z * plane_len, data_.begin() + (z + 1) * plane_len,
                  out.data_.begin());
        return out;
    }

    static size_t countElements(const std::vector<size_t>& shape) {
        if (shape.empty()) return 0;
        return std::accumulate(shape.begin(), shape.end(), size_t(1), std::multiplies<size_t>());
    }

    static std::string shapeToString(const std::vector<size_t>& shape) {
        std::string s = "(";
        for (size_t i = 0; i < shape.size(); ++i) {
            if (i > 0) s += ", ";
            s += std::to_string(shape[i]);
        }
        return s + ")";
    }

private:
    std::vector<size_t> shape_;
    std::vector<T> data_;
};

using Image = Raster<scalar_t>;
using LabelMap = Raster<label_t>;

/**
 * @brief Maximum intensity projection along the outermost axis
 * @param stack Raster of shape (planes, rows, cols)
 * @return 2-D image of shape (rows, cols); a 2-D input is returned unchanged
 */
Image maxProjection(const Image& stack);

/**
 * @brief Pixel-wise difference a - b
 * @throws std::invalid_argument on shape mismatch
 */
Image subtract(const Image& a, const Image& b);

/**
 * @brief Require a 2-D raster, naming the operation in the error message
 * @throws std::invalid_argument if the shape is not 2-D or has an empty axis
 */
void requireImage2D(const std::vector<size_t>& shape, const std::string& operation);

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_IMAGE_HPP
