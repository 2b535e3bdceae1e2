/**
 * @file tiff_io.cpp
 * @brief GDAL-backed TIFF reading and writing
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/tiff_io.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// GDAL includes
#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_string.h>

namespace nuclei_spots {

namespace {

struct DatasetCloser {
    void operator()(GDALDataset* ds) const {
        if (ds != nullptr) {
            GDALClose(ds);
        }
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

// Divisor and offset mapping integer samples onto [0, 1]
bool normalizationFor(GDALDataType type, double& offset, double& scale) {
    switch (type) {
        case GDT_Byte:
            offset = 0.0;
            scale = std::numeric_limits<uint8_t>::max();
            return true;
        case GDT_UInt16:
            offset = 0.0;
            scale = std::numeric_limits<uint16_t>::max();
            return true;
        case GDT_UInt32:
            offset = 0.0;
            scale = std::numeric_limits<uint32_t>::max();
            return true;
        case GDT_Int16:
            offset = std::numeric_limits<int16_t>::min();
            scale = static_cast<double>(std::numeric_limits<int16_t>::max()) - offset;
            return true;
        case GDT_Int32:
            offset = std::numeric_limits<int32_t>::min();
            scale = static_cast<double>(std::numeric_limits<int32_t>::max()) - offset;
            return true;
        default:
            return false;
    }
}

DatasetPtr createTiff(const std::string& path, int width, int height, int bands,
                      GDALDataType type)
{
    GDALAllRegister();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (driver == nullptr) {
        throw std::runtime_error("Failed to get GTiff driver");
    }

    char** options = nullptr;
    options = CSLSetNameValue(options, "COMPRESS", "DEFLATE");
    if (bands > 1) {
        options = CSLSetNameValue(options, "INTERLEAVE", "PIXEL");
    }

    DatasetPtr dataset(driver->Create(path.c_str(), width, height, bands, type, options));
    CSLDestroy(options);

    if (!dataset) {
        throw std::runtime_error("Failed to create output dataset: " + path);
    }
    return dataset;
}

void checkWritable2D(const std::vector<size_t>& shape, const std::string& operation) {
    requireImage2D(shape, operation);
    if (shape[0] > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        shape[1] > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(operation + ": raster too large for GDAL");
    }
}

} // namespace

class TiffImage::Impl {
public:
    explicit Impl(const std::string& path)
        : path_(path),
          width_(0),
          height_(0),
          band_count_(0)
    {
        // Initialize GDAL
        GDALAllRegister();

        dataset_.reset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
        if (!dataset_) {
            throw std::runtime_error("Failed to open image file: " + path);
        }

        width_ = dataset_->GetRasterXSize();
        height_ = dataset_->GetRasterYSize();
        band_count_ = dataset_->GetRasterCount();

        if (band_count_ < 1) {
            throw std::runtime_error("Image file has no raster bands: " + path);
        }

        // GTiff lists every page as SUBDATASET_<n>_NAME=GTIFF_DIR:<n>:<path>
        // once the file holds more than one
        CSLConstList subdatasets = dataset_->GetMetadata("SUBDATASETS");
        for (int i = 0; subdatasets != nullptr && subdatasets[i] != nullptr; ++i) {
            char* key = nullptr;
            const char* value = CPLParseNameValue(subdatasets[i], &key);
            if (key != nullptr && value != nullptr) {
                const std::string name(key);
                const std::string suffix = "_NAME";
                if (name.size() > suffix.size() &&
                    name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
                    pages_.emplace_back(value);
                }
            }
            CPLFree(key);
        }
    }

    const std::string& path() const { return path_; }
    int width() const { return width_; }
    int height() const { return height_; }
    int bandCount() const { return band_count_; }
    int pageCount() const { return pages_.empty() ? 1 : static_cast<int>(pages_.size()); }

    GDALDataType dataType() const {
        return dataset_->GetRasterBand(1)->GetRasterDataType();
    }

    GDALRasterBand* band(int index) const {
        if (index < 1 || index > band_count_) {
            throw std::invalid_argument("Band " + std::to_string(index) + " out of range 1.." +
                                        std::to_string(band_count_) + " in " + path_);
        }
        return dataset_->GetRasterBand(index);
    }

    // Pages past the first, opened on demand
    DatasetPtr openPage(int page) const {
        const std::string& name = pages_[static_cast<size_t>(page - 1)];
        DatasetPtr ds(static_cast<GDALDataset*>(GDALOpen(name.c_str(), GA_ReadOnly)));
        if (!ds) {
            throw std::runtime_error("Failed to open page " + std::to_string(page) + " of " + path_);
        }
        if (ds->GetRasterXSize() != width_ || ds->GetRasterYSize() != height_ ||
            ds->GetRasterCount() != band_count_) {
            throw std::runtime_error("Page " + std::to_string(page) + " of " + path_ + " is " +
                                     std::to_string(ds->GetRasterXSize()) + " x " +
                                     std::to_string(ds->GetRasterYSize()) + " with " +
                                     std::to_string(ds->GetRasterCount()) +
                                     " band(s), unlike the first page");
        }
        return ds;
    }

    // Reads into `out`, which must hold width*height samples
    void readInto(GDALRasterBand* b, bool normalize, scalar_t* out,
                  const std::string& what) const {
        CPLErr err = b->RasterIO(GF_Read, 0, 0, width_, height_,
                                 out, width_, height_,
                                 GDT_Float64, 0, 0);
        if (err != CE_None) {
            throw std::runtime_error("Failed to read " + what + " from " + path_);
        }

        double offset = 0.0;
        double scale = 1.0;
        if (normalize && normalizationFor(b->GetRasterDataType(), offset, scale)) {
            const size_t n = static_cast<size_t>(width_) * static_cast<size_t>(height_);
            for (size_t i = 0; i < n; ++i) {
                out[i] = (out[i] - offset) / scale;
            }
        }
    }

    void readBandInto(int index, bool normalize, scalar_t* out) const {
        readInto(band(index), normalize, out, "band " + std::to_string(index));
    }

    void readStackInto(bool normalize, scalar_t* out) const {
        const size_t plane_len = static_cast<size_t>(width_) * static_cast<size_t>(height_);
        for (int b = 1; b <= band_count_; ++b) {
            readBandInto(b, normalize, out);
            out += plane_len;
        }
        for (int page = 2; page <= pageCount(); ++page) {
            DatasetPtr ds = openPage(page);
            for (int b = 1; b <= band_count_; ++b) {
                readInto(ds->GetRasterBand(b), normalize, out,
                         "page " + std::to_string(page) + " band " + std::to_string(b));
                out += plane_len;
            }
        }
    }

    LabelMap readLabels(int index) const {
        GDALRasterBand* b = band(index);
        LabelMap labels(static_cast<size_t>(height_), static_cast<size_t>(width_));
        CPLErr err = b->RasterIO(GF_Read, 0, 0, width_, height_,
                                 labels.data(), width_, height_,
                                 GDT_Int32, 0, 0);
        if (err != CE_None) {
            throw std::runtime_error("Failed to read label band " + std::to_string(index) +
                                     " from " + path_);
        }
        return labels;
    }

private:
    std::string path_;
    int width_;
    int height_;
    int band_count_;
    std::vector<std::string> pages_;
    DatasetPtr dataset_;
};

TiffImage::TiffImage(const std::string& path)
    : pImpl(std::make_unique<Impl>(path))
{
}

TiffImage::~TiffImage() = default;
TiffImage::TiffImage(TiffImage&&) noexcept = default;
TiffImage& TiffImage::operator=(TiffImage&&) noexcept = default;

const std::string& TiffImage::path() const { return pImpl->path(); }
int TiffImage::width() const { return pImpl->width(); }
int TiffImage::height() const { return pImpl->height(); }
int TiffImage::bandCount() const { return pImpl->bandCount(); }
int TiffImage::pageCount() const { return pImpl->pageCount(); }

std::string TiffImage::sampleType() const {
    return GDALGetDataTypeName(pImpl->dataType());
}

bool TiffImage::isIntegerType() const {
    const GDALDataType type = pImpl->dataType();
    return GDALDataTypeIsInteger(type) && !GDALDataTypeIsComplex(type);
}

Image TiffImage::readBand(int band, bool normalize) const {
    Image image(static_cast<size_t>(height()), static_cast<size_t>(width()));
    pImpl->readBandInto(band, normalize, image.data());
    return image;
}

Image TiffImage::readStack(bool normalize) const {
    const size_t planes = static_cast<size_t>(pageCount()) * static_cast<size_t>(bandCount());
    Image stack(std::vector<size_t>{planes, static_cast<size_t>(height()),
                                    static_cast<size_t>(width())});
    pImpl->readStackInto(normalize, stack.data());
    return stack;
}

LabelMap TiffImage::readLabels(int band) const {
    return pImpl->readLabels(band);
}

Image readImage(const std::string& path, int band, bool normalize) {
    return TiffImage(path).readBand(band, normalize);
}

LabelMap readLabelMap(const std::string& path, int band) {
    return TiffImage(path).readLabels(band);
}

void writeImage(const Image& image, const std::string& path) {
    checkWritable2D(image.shape(), "writeImage");
    const int width = static_cast<int>(image.cols());
    const int height = static_cast<int>(image.rows());

    DatasetPtr dataset = createTiff(path, width, height, 1, GDT_Float32);

    // GDAL converts the double buffer to Float32 on write
    std::vector<scalar_t> buffer(image.values());
    CPLErr err = dataset->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, width, height,
                                                     buffer.data(), width, height,
                                                     GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw std::runtime_error("Failed to write data to output dataset: " + path);
    }
}

void writeLabelMap(const LabelMap& labels, const std::string& path) {
    checkWritable2D(labels.shape(), "writeLabelMap");
    const int width = static_cast<int>(labels.cols());
    const int height = static_cast<int>(labels.rows());

    DatasetPtr dataset = createTiff(path, width, height, 1, GDT_Int32);

    GDALRasterBand* band = dataset->GetRasterBand(1);
    band->SetNoDataValue(BACKGROUND_LABEL);

    std::vector<label_t> buffer(labels.values());
    CPLErr err = band->RasterIO(GF_Write, 0, 0, width, height,
                                buffer.data(), width, height,
                                GDT_Int32, 0, 0);
    if (err != CE_None) {
        throw std::runtime_error("Failed to write data to output dataset: " + path);
    }
}

void writeRGBA(const RGBAImage& rgba, const std::string& path) {
    if (rgba.ndim() != 3 || rgba.shape(2) != 4) {
        throw std::invalid_argument("writeRGBA: expected shape (rows, cols, 4), got " +
                                    RGBAImage::shapeToString(rgba.shape()));
    }
    checkWritable2D({rgba.shape(0), rgba.shape(1)}, "writeRGBA");
    const int width = static_cast<int>(rgba.shape(1));
    const int height = static_cast<int>(rgba.shape(0));

    DatasetPtr dataset = createTiff(path, width, height, 4, GDT_Byte);

    const GDALColorInterp interp[4] = {GCI_RedBand, GCI_GreenBand, GCI_BlueBand, GCI_AlphaBand};
    for (int b = 0; b < 4; ++b) {
        dataset->GetRasterBand(b + 1)->SetColorInterpretation(interp[b]);
    }

    // Pixel-interleaved source: pixel stride 4 bytes, line stride 4*width bytes
    std::vector<uint8_t> buffer(rgba.values());
    int band_map[4] = {1, 2, 3, 4};
    CPLErr err = dataset->RasterIO(GF_Write, 0, 0, width, height,
                                   buffer.data(), width, height, GDT_Byte,
                                   4, band_map,
                                   4, static_cast<GSpacing>(4) * width, 1,
                                   nullptr);
    if (err != CE_None) {
        throw std::runtime_error("Failed to write data to output dataset: " + path);
    }
}

} // namespace nuclei_spots
