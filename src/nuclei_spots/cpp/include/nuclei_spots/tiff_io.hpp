/**
 * @file tiff_io.hpp
 * @brief TIFF raster input and output through GDAL
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_TIFF_IO_HPP
#define NUCLEI_SPOTS_TIFF_IO_HPP

#include <memory>
#include <string>

#include "nuclei_spots/common.hpp"
#include "nuclei_spots/image.hpp"
#include "nuclei_spots/color_cycle.hpp"

namespace nuclei_spots {

/**
 * @class TiffImage
 * @brief Read-only view of a (possibly multi-band) TIFF file
 *
 * Bands and pages are numbered from 1, as in GDAL. Channels of one page are
 * bands; the pages of a multi-page TIFF (a z-stack or time series) are read
 * through GDAL's SUBDATASETS list and must all share the first page's size
 * and band count.
 */
class TiffImage {
public:
    /**
     * @brief Open a raster file
     * @param path File to open
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit TiffImage(const std::string& path);

    ~TiffImage();

    TiffImage(TiffImage&&) noexcept;
    TiffImage& operator=(TiffImage&&) noexcept;
    TiffImage(const TiffImage&) = delete;
    TiffImage& operator=(const TiffImage&) = delete;

    const std::string& path() const;
    int width() const;
    int height() const;
    int bandCount() const;

    /**
     * @brief Number of pages (1 for a single-page file)
     */
    int pageCount() const;

    /**
     * @brief GDAL name of the sample type of band 1 ("Byte", "UInt16", "Float32", ...)
     */
    std::string sampleType() const;

    /**
     * @brief Whether band 1 stores integer samples
     */
    bool isIntegerType() const;

    /**
     * @brief Read one band of the first page as a 2-D image
     * @param band Band number, starting at 1
     * @param normalize Scale integer samples to [0, 1]; floating samples are kept
     * @throws std::invalid_argument if the band does not exist
     * @throws std::runtime_error if reading fails
     */
    Image readBand(int band = 1, bool normalize = true) const;

    /**
     * @brief Read every band of every page into a (pages * bands, rows, cols) stack
     *
     * Planes are ordered page by page, bands within a page.
     * @throws std::runtime_error if a page cannot be read or differs in size
     */
    Image readStack(bool normalize = true) const;

    /**
     * @brief Read one band as integer labels
     */
    LabelMap readLabels(int band = 1) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Read a single band of a TIFF file as an intensity image
 */
Image readImage(const std::string& path, int band = 1, bool normalize = true);

/**
 * @brief Read a single band of a TIFF file as a label map
 */
LabelMap readLabelMap(const std::string& path, int band = 1);

/**
 * @brief Write a 2-D image as a single-band Float32 GeoTIFF
 * @throws std::runtime_error if the file cannot be created or written
 */
void writeImage(const Image& image, const std::string& path);

/**
 * @brief Write a 2-D label map as a single-band Int32 GeoTIFF
 */
void writeLabelMap(const LabelMap& labels, const std::string& path);

/**
 * @brief Write a (rows, cols, 4) raster as a 4-band Byte GeoTIFF
 */
void writeRGBA(const RGBAImage& rgba, const std::string& path);

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_TIFF_IO_HPP
