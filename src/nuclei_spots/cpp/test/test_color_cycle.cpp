/**
 * @file test_color_cycle.cpp
 * @brief Tests for palette cycling and label map coloring
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include <catch2/catch.hpp>
#include "nuclei_spots/color_cycle.hpp"
#include <set>
#include <stdexcept>
#include <tuple>
#include <vector>

using namespace nuclei_spots;

namespace {

std::tuple<float, float, float, float> asTuple(const RGBA& c) {
    return std::make_tuple(c.r, c.g, c.b, c.a);
}

} // namespace

TEST_CASE("Default palette", "[ColorCycle]") {
    const std::vector<RGBA>& palette = defaultPalette();
    REQUIRE(palette.size() == 10);
    REQUIRE(palette[0].r == Approx(0x1f / 255.0f));
    REQUIRE(palette[0].g == Approx(0x77 / 255.0f));
    REQUIRE(palette[0].b == Approx(0xb4 / 255.0f));
    REQUIRE(palette[9].r == Approx(0x17 / 255.0f));
    for (const RGBA& c : palette) {
        REQUIRE(c.a == 1.0f);
    }
}

TEST_CASE("Colors follow first appearance", "[ColorCycle]") {
    const std::vector<RGBA>& palette = defaultPalette();

    SECTION("Repeated labels keep their color") {
        ColorCycle cycle;
        REQUIRE(cycle.colorFor(5) == palette[0]);
        REQUIRE(cycle.colorFor(2) == palette[1]);
        REQUIRE(cycle.colorFor(5) == palette[0]);
        REQUIRE(cycle.colorFor(9) == palette[2]);
        REQUIRE(cycle.size() == 3);
        REQUIRE(cycle.contains(2));
        REQUIRE_FALSE(cycle.contains(3));
    }

    SECTION("Injective up to the palette length") {
        std::vector<label_t> labels;
        for (label_t l = 1; l <= 10; ++l) {
            labels.push_back(l * 11);
        }
        const std::map<label_t, RGBA> mapping = labelColors(labels);
        std::set<std::tuple<float, float, float, float>> distinct;
        for (const auto& entry : mapping) {
            distinct.insert(asTuple(entry.second));
        }
        REQUIRE(distinct.size() == 10);
    }

    SECTION("Colors repeat every palette length") {
        std::vector<label_t> labels;
        for (label_t l = 1; l <= 25; ++l) {
            labels.push_back(l);
        }
        const std::map<label_t, RGBA> mapping = labelColors(labels);
        REQUIRE(mapping.size() == 25);
        for (label_t l = 1; l <= 15; ++l) {
            REQUIRE(mapping.at(l) == mapping.at(l + 10));
        }
        REQUIRE(mapping.at(1) != mapping.at(2));
    }

    SECTION("Custom palette") {
        const std::vector<RGBA> two = {RGBA{1, 0, 0, 1}, RGBA{0, 1, 0, 1}};
        const std::map<label_t, RGBA> mapping = labelColors({4, 4, 8, 1}, two);
        REQUIRE(mapping.at(4) == two[0]);
        REQUIRE(mapping.at(8) == two[1]);
        REQUIRE(mapping.at(1) == two[0]);
        REQUIRE_THROWS_AS(ColorCycle(std::vector<RGBA>{}), std::invalid_argument);
    }

    SECTION("Colors for a label sequence") {
        const std::map<label_t, RGBA> mapping = labelColors({3, 1});
        const std::vector<RGBA> colors = colorsForLabels({1, 1, 3}, mapping);
        REQUIRE(colors.size() == 3);
        REQUIRE(colors[0] == palette[1]);
        REQUIRE(colors[2] == palette[0]);
        REQUIRE_THROWS_AS(colorsForLabels({2}, mapping), std::invalid_argument);
    }
}

TEST_CASE("Colorized label map", "[ColorCycle]") {
    LabelMap labels(3, 4);
    labels(0, 0) = 2;
    labels(1, 1) = 6;
    labels(2, 3) = 9;

    const std::map<label_t, RGBA> mapping = labelColors({6, 2});
    const RGBAImage rgba = colorizeLabelMap(labels, mapping);
    REQUIRE(rgba.shape() == std::vector<size_t>{3, 4, 4});

    // Label 6 was seen first
    REQUIRE(rgba(1, 1, 0) == 0x1f);
    REQUIRE(rgba(1, 1, 1) == 0x77);
    REQUIRE(rgba(1, 1, 2) == 0xb4);
    REQUIRE(rgba(1, 1, 3) == 255);
    REQUIRE(rgba(0, 0, 0) == 0xff);
    REQUIRE(rgba(0, 0, 1) == 0x7f);
    REQUIRE(rgba(0, 0, 2) == 0x0e);

    // Background and unmapped labels are transparent
    REQUIRE(rgba(0, 1, 3) == 0);
    REQUIRE(rgba(2, 3, 3) == 0);

    REQUIRE_THROWS_AS(colorizeLabelMap(LabelMap(std::vector<size_t>{2, 2, 2}), mapping),
                      std::invalid_argument);
}
