/**
 * @file test_filters.cpp
 * @brief Tests for the Gaussian filters
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include <catch2/catch.hpp>
#include "nuclei_spots/filters.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

using namespace nuclei_spots;

namespace {

Image randomImage(size_t rows, size_t cols, unsigned int seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<scalar_t> dist(0.0, 1.0);
    Image image(rows, cols);
    for (scalar_t& v : image.values()) {
        v = dist(rng);
    }
    return image;
}

// Unit-peak Gaussian blob centered on a pixel
Image gaussianBlob(size_t rows, size_t cols, scalar_t row, scalar_t col, scalar_t sigma) {
    Image image(rows, cols);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            const scalar_t dr = r - row;
            const scalar_t dc = c - col;
            image(r, c) = std::exp(-(dr * dr + dc * dc) / (2.0 * sigma * sigma));
        }
    }
    return image;
}

} // namespace

TEST_CASE("Gaussian kernel shape and normalization", "[Filters]") {
    SECTION("Radius follows truncate * sigma") {
        REQUIRE(gaussianKernel1D(1.0).size() == 9);
        REQUIRE(gaussianKernel1D(2.0).size() == 17);
        REQUIRE(gaussianKernel1D(1.5).size() == 13);
        REQUIRE(gaussianKernel1D(2.0, 0, 2.0).size() == 9);
    }

    SECTION("Smoothing kernel sums to one and is symmetric") {
        const std::vector<scalar_t> k = gaussianKernel1D(2.0);
        REQUIRE(std::accumulate(k.begin(), k.end(), 0.0) == Approx(1.0).epsilon(1e-12));
        for (size_t i = 0; i < k.size() / 2; ++i) {
            REQUIRE(k[i] == Approx(k[k.size() - 1 - i]));
        }
        REQUIRE(*std::max_element(k.begin(), k.end()) == k[k.size() / 2]);
    }

    SECTION("Second derivative kernel is symmetric with a negative center") {
        const std::vector<scalar_t> k = gaussianKernel1D(1.0, 2);
        REQUIRE(k[k.size() / 2] < 0.0);
        for (size_t i = 0; i < k.size() / 2; ++i) {
            REQUIRE(k[i] == Approx(k[k.size() - 1 - i]));
        }
    }

    SECTION("First derivative kernel is antisymmetric") {
        const std::vector<scalar_t> k = gaussianKernel1D(1.0, 1);
        REQUIRE(k[k.size() / 2] == Approx(0.0).margin(1e-15));
        for (size_t i = 0; i < k.size() / 2; ++i) {
            REQUIRE(k[i] == Approx(-k[k.size() - 1 - i]));
        }
    }

    SECTION("Invalid arguments") {
        REQUIRE_THROWS_AS(gaussianKernel1D(0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(gaussianKernel1D(-1.0), std::invalid_argument);
        REQUIRE_THROWS_AS(gaussianKernel1D(1.0, -1), std::invalid_argument);
        REQUIRE_THROWS_AS(gaussianKernel1D(1.0, 0, 0.0), std::invalid_argument);
    }
}

TEST_CASE("correlateAxis uses half-sample symmetric boundaries", "[Filters]") {
    const Image row = Image::fromData({1, 3}, {1.0, 2.0, 3.0});

    SECTION("Identity kernel") {
        const Image out = correlateAxis(row, 1, {0.0, 1.0, 0.0});
        REQUIRE(out.values() == row.values());
    }

    SECTION("Shift right reflects the first sample") {
        const Image out = correlateAxis(row, 1, {1.0, 0.0, 0.0});
        REQUIRE(out.values() == std::vector<scalar_t>{1.0, 1.0, 2.0});
    }

    SECTION("Shift left reflects the last sample") {
        const Image out = correlateAxis(row, 1, {0.0, 0.0, 1.0});
        REQUIRE(out.values() == std::vector<scalar_t>{2.0, 3.0, 3.0});
    }

    SECTION("Single-sample axis") {
        const Image out = correlateAxis(row, 0, {0.25, 0.5, 0.25});
        REQUIRE(out.values() == row.values());
    }

    SECTION("Invalid arguments") {
        REQUIRE_THROWS_AS(correlateAxis(row, 2, {1.0}), std::invalid_argument);
        REQUIRE_THROWS_AS(correlateAxis(row, 1, {0.5, 0.5}), std::invalid_argument);
        REQUIRE_THROWS_AS(correlateAxis(row, 1, {}), std::invalid_argument);
    }
}

TEST_CASE("Gaussian filter", "[Filters]") {
    SECTION("Constant image is unchanged") {
        const Image image(20, 30, 0.7);
        const Image out = gaussianFilter(image, 2.0);
        REQUIRE(out.shape() == image.shape());
        for (scalar_t v : out.values()) {
            REQUIRE(v == Approx(0.7).epsilon(1e-12));
        }
    }

    SECTION("Smoothing lowers the peak of a blob") {
        const Image blob = gaussianBlob(32, 32, 16, 16, 1.5);
        const Image out = gaussianFilter(blob, 2.0);
        REQUIRE(out(16, 16) < blob(16, 16));
        REQUIRE(out(16, 16) == Approx(1.5 * 1.5 / (1.5 * 1.5 + 4.0)).epsilon(0.01));
    }

    SECTION("N-dimensional input keeps its shape") {
        Image stack(std::vector<size_t>{3, 10, 12}, 1.0);
        stack(1, 5, 6) = 10.0;
        const Image out = gaussianFilter(stack, 1.0);
        REQUIRE(out.shape() == stack.shape());
        REQUIRE(out(1, 5, 6) < 10.0);
        REQUIRE(out(0, 5, 6) > 1.0);
    }

    SECTION("Non-positive sigma throws") {
        const Image image(8, 8, 1.0);
        REQUIRE_THROWS_AS(gaussianFilter(image, 0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(gaussianFilter(image, -2.0), std::invalid_argument);
        REQUIRE_THROWS_AS(gaussianFilter(image, std::nan("")), std::invalid_argument);
    }
}

TEST_CASE("Gaussian high-pass filter", "[Filters]") {
    SECTION("High pass plus low pass reconstructs the image") {
        const Image image = randomImage(40, 50, 42);
        for (scalar_t sigma : {0.5, 1.0, 2.0, 3.5}) {
            const Image high = gaussianHighPass(image, sigma);
            const Image low = gaussianFilter(image, sigma);
            REQUIRE(high.shape() == image.shape());
            for (size_t i = 0; i < image.size(); ++i) {
                REQUIRE(high.values()[i] + low.values()[i] ==
                        Approx(image.values()[i]).margin(1e-12));
            }
        }
    }

    SECTION("Constant image gives zero") {
        const Image out = gaussianHighPass(Image(16, 16, 3.0));
        for (scalar_t v : out.values()) {
            REQUIRE(v == Approx(0.0).margin(1e-12));
        }
    }

    SECTION("Output may be negative") {
        const Image out = gaussianHighPass(gaussianBlob(32, 32, 16, 16, 1.5));
        REQUIRE(out(16, 16) > 0.0);
        REQUIRE(*std::min_element(out.values().begin(), out.values().end()) < 0.0);
    }

    SECTION("Default sigma is 2") {
        const Image image = randomImage(24, 24, 7);
        REQUIRE(gaussianHighPass(image).values() == gaussianHighPass(image, 2.0).values());
    }

    SECTION("Non-positive sigma throws") {
        REQUIRE_THROWS_AS(gaussianHighPass(Image(8, 8, 1.0), 0.0), std::invalid_argument);
    }
}

TEST_CASE("Laplacian of Gaussian", "[Filters]") {
    SECTION("Flat image gives a near-zero response") {
        const Image out = gaussianLaplace(Image(20, 20, 1.0), 1.0);
        for (scalar_t v : out.values()) {
            REQUIRE(v == Approx(0.0).margin(1e-3));
        }
    }

    SECTION("Bright blob gives a negative response at its center") {
        const Image blob = gaussianBlob(32, 32, 16, 16, 1.5);
        const Image out = gaussianLaplace(blob, 1.0);
        // Continuous value: -2 * s^2 / (s^2 + sigma^2)^2
        REQUIRE(out(16, 16) == Approx(-2.0 * 2.25 / (3.25 * 3.25)).epsilon(0.02));
        REQUIRE(out(16, 16) == *std::min_element(out.values().begin(), out.values().end()));
    }

    SECTION("Non-positive sigma throws") {
        REQUIRE_THROWS_AS(gaussianLaplace(Image(8, 8, 1.0), 0.0), std::invalid_argument);
    }
}
