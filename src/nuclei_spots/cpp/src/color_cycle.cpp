/**
 * @file color_cycle.cpp
 * @brief Palette cycling for nucleus and spot colors
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/color_cycle.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace nuclei_spots {

namespace {

RGBA fromHex(uint32_t rgb) {
    return RGBA{((rgb >> 16) & 0xFF) / 255.0f, ((rgb >> 8) & 0xFF) / 255.0f,
                (rgb & 0xFF) / 255.0f, 1.0f};
}

uint8_t toByte(float v) {
    v = std::max(0.0f, std::min(1.0f, v));
    return static_cast<uint8_t>(std::lround(v * 255.0f));
}

} // namespace

const std::vector<RGBA>& defaultPalette() {
    static const std::vector<RGBA> palette = {
        fromHex(0x1f77b4), // blue
        fromHex(0xff7f0e), // orange
        fromHex(0x2ca02c), // green
        fromHex(0xd62728), // red
        fromHex(0x9467bd), // purple
        fromHex(0x8c564b), // brown
        fromHex(0xe377c2), // pink
        fromHex(0x7f7f7f), // gray
        fromHex(0xbcbd22), // olive
        fromHex(0x17becf), // cyan
    };
    return palette;
}

ColorCycle::ColorCycle() : palette_(defaultPalette()) {}

ColorCycle::ColorCycle(std::vector<RGBA> palette) : palette_(std::move(palette)) {
    if (palette_.empty()) {
        throw std::invalid_argument("ColorCycle: palette must not be empty");
    }
}

RGBA ColorCycle::colorFor(label_t label) {
    auto it = mapping_.find(label);
    if (it != mapping_.end()) {
        return it->second;
    }
    const RGBA color = palette_[next_ % palette_.size()];
    ++next_;
    mapping_.emplace(label, color);
    return color;
}

std::map<label_t, RGBA> labelColors(const std::vector<label_t>& labels,
                                    const std::vector<RGBA>& palette)
{
    ColorCycle cycle(palette);
    for (label_t label : labels) {
        cycle.colorFor(label);
    }
    return cycle.mapping();
}

std::vector<RGBA> colorsForLabels(const std::vector<label_t>& labels,
                                  const std::map<label_t, RGBA>& mapping)
{
    std::vector<RGBA> colors;
    colors.reserve(labels.size());
    for (label_t label : labels) {
        auto it = mapping.find(label);
        if (it == mapping.end()) {
            throw std::invalid_argument("colorsForLabels: no color for label " +
                                        std::to_string(label));
        }
        colors.push_back(it->second);
    }
    return colors;
}

RGBAImage colorizeLabelMap(const LabelMap& labels, const std::map<label_t, RGBA>& mapping) {
    requireImage2D(labels.shape(), "colorizeLabelMap");

    const size_t rows = labels.rows();
    const size_t cols = labels.cols();
    RGBAImage out(std::vector<size_t>{rows, cols, 4}, 0);

    uint8_t* dst = out.data();
    for (size_t i = 0; i < rows * cols; ++i) {
        const label_t label = labels.data()[i];
        if (label == BACKGROUND_LABEL) continue;
        auto it = mapping.find(label);
        if (it == mapping.end()) continue;
        const RGBA& c = it->second;
        dst[4 * i + 0] = toByte(c.r);
        dst[4 * i + 1] = toByte(c.g);
        dst[4 * i + 2] = toByte(c.b);
        dst[4 * i + 3] = toByte(c.a);
    }
    return out;
}

} // namespace nuclei_spots
