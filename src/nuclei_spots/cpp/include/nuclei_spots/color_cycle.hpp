/**
 * @file color_cycle.hpp
 * @brief Label-to-color mapping by cycling a fixed palette
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_COLOR_CYCLE_HPP
#define NUCLEI_SPOTS_COLOR_CYCLE_HPP

#include <cstdint>
#include <map>
#include <vector>

#include "nuclei_spots/common.hpp"
#include "nuclei_spots/image.hpp"

namespace nuclei_spots {

/**
 * @struct RGBA
 * @brief Color with components in [0, 1]
 */
struct RGBA {
    float r;
    float g;
    float b;
    float a;

    bool operator==(const RGBA& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const RGBA& o) const { return !(*this == o); }
};

using RGBAImage = Raster<uint8_t>;  ///< Shape (rows, cols, 4)

/**
 * @brief The 10-color "tab10" palette
 */
const std::vector<RGBA>& defaultPalette();

/**
 * @class ColorCycle
 * @brief Hands out palette colors to labels in order of first appearance
 *
 * The first label seen gets palette[0], the second new label palette[1],
 * and so on, wrapping around after the last palette entry.
 */
class ColorCycle {
public:
    ColorCycle();
    explicit ColorCycle(std::vector<RGBA> palette);

    /**
     * @brief Color of a label, assigning the next palette entry on first use
     */
    RGBA colorFor(label_t label);

    bool contains(label_t label) const { return mapping_.count(label) > 0; }
    size_t size() const { return mapping_.size(); }
    const std::map<label_t, RGBA>& mapping() const { return mapping_; }
    const std::vector<RGBA>& palette() const { return palette_; }

private:
    std::vector<RGBA> palette_;
    std::map<label_t, RGBA> mapping_;
    size_t next_ = 0;
};

/**
 * @brief Build a label->color mapping from a label sequence
 * @param labels Labels in the order they are encountered (duplicates allowed)
 * @param palette Colors to cycle through
 */
std::map<label_t, RGBA> labelColors(const std::vector<label_t>& labels,
                                    const std::vector<RGBA>& palette = defaultPalette());

/**
 * @brief Color of each element of a label sequence
 */
std::vector<RGBA> colorsForLabels(const std::vector<label_t>& labels,
                                  const std::map<label_t, RGBA>& mapping);

/**
 * @brief Paint a label map with a label->color mapping
 *
 * Background and labels missing from the mapping become fully transparent.
 *
 * @return 8-bit RGBA raster of shape (rows, cols, 4)
 */
RGBAImage colorizeLabelMap(const LabelMap& labels, const std::map<label_t, RGBA>& mapping);

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_COLOR_CYCLE_HPP
