/**
 * @file bindings.cpp
 * @brief Python bindings for the nuclei/spots analysis library
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "nuclei_spots/common.hpp"
#include "nuclei_spots/image.hpp"
#include "nuclei_spots/filters.hpp"
#include "nuclei_spots/blob_detection.hpp"
#include "nuclei_spots/spot_detector.hpp"
#include "nuclei_spots/regions.hpp"
#include "nuclei_spots/nucleus_assignment.hpp"
#include "nuclei_spots/color_cycle.hpp"
#include "nuclei_spots/tiff_io.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace py = pybind11;
using namespace nuclei_spots;

namespace {

// Copy a C-contiguous numpy array into a Raster of the same shape
template <typename T>
Raster<T> numpy_to_raster(py::array_t<T, py::array::c_style | py::array::forcecast> array) {
    py::buffer_info buffer = array.request();

    std::vector<size_t> shape(buffer.shape.begin(), buffer.shape.end());
    std::vector<T> data(static_cast<const T*>(buffer.ptr),
                        static_cast<const T*>(buffer.ptr) + buffer.size);
    return Raster<T>::fromData(std::move(shape), std::move(data));
}

template <typename T>
py::array_t<T> raster_to_numpy(const Raster<T>& raster) {
    std::vector<ssize_t> shape(raster.shape().begin(), raster.shape().end());
    py::array_t<T> array(shape);

    py::buffer_info buffer = array.request();
    std::copy(raster.data(), raster.data() + raster.size(), static_cast<T*>(buffer.ptr));
    return array;
}

// (N, 2) float array of (row, col) points
std::vector<Point2D> numpy_to_points(py::array_t<scalar_t, py::array::c_style | py::array::forcecast> array) {
    py::buffer_info buffer = array.request();
    if (buffer.size == 0) {
        return {};
    }
    if (buffer.ndim != 2 || buffer.shape[1] != 2) {
        throw std::invalid_argument("Expected an (N, 2) array of (row, col) points");
    }

    const scalar_t* ptr = static_cast<const scalar_t*>(buffer.ptr);
    std::vector<Point2D> points;
    points.reserve(static_cast<size_t>(buffer.shape[0]));
    for (ssize_t i = 0; i < buffer.shape[0]; ++i) {
        points.emplace_back(ptr[2 * i], ptr[2 * i + 1]);
    }
    return points;
}

py::array_t<scalar_t> points_to_numpy(const std::vector<Point2D>& points) {
    py::array_t<scalar_t> array({static_cast<ssize_t>(points.size()), static_cast<ssize_t>(2)});
    auto view = array.mutable_unchecked<2>();
    for (size_t i = 0; i < points.size(); ++i) {
        view(i, 0) = points[i].row;
        view(i, 1) = points[i].col;
    }
    return array;
}

py::tuple rgba_to_tuple(const RGBA& c) {
    return py::make_tuple(c.r, c.g, c.b, c.a);
}

} // namespace

PYBIND11_MODULE(_nuclei_spots, m) {
    m.doc() = "Spot detection and nearest-nucleus assignment for microscopy images";

    // Version info
    m.attr("__version__") = NUCLEI_SPOTS_VERSION;

    // ==== Structs ====

    py::class_<BlobLogParams>(m, "BlobLogParams")
        .def(py::init<>())
        .def_readwrite("min_sigma", &BlobLogParams::min_sigma)
        .def_readwrite("max_sigma", &BlobLogParams::max_sigma)
        .def_readwrite("num_sigma", &BlobLogParams::num_sigma)
        .def_readwrite("threshold", &BlobLogParams::threshold)
        .def_readwrite("overlap", &BlobLogParams::overlap)
        .def_readwrite("exclude_border", &BlobLogParams::exclude_border);

    py::class_<SpotDetectionParams>(m, "SpotDetectionParams")
        .def(py::init<>())
        .def_readwrite("high_pass_sigma", &SpotDetectionParams::high_pass_sigma)
        .def_readwrite("threshold", &SpotDetectionParams::threshold)
        .def_readwrite("blob_sigma", &SpotDetectionParams::blob_sigma)
        .def_readwrite("min_sigma", &SpotDetectionParams::min_sigma)
        .def_readwrite("overlap", &SpotDetectionParams::overlap)
        .def_readwrite("exclude_border", &SpotDetectionParams::exclude_border);

    // ==== Filters ====

    m.def("gaussian_filter", [](py::array_t<scalar_t, py::array::c_style | py::array::forcecast> image,
                                scalar_t sigma, scalar_t truncate) {
        return raster_to_numpy(gaussianFilter(numpy_to_raster<scalar_t>(image), sigma, truncate));
    }, py::arg("image"), py::arg("sigma"), py::arg("truncate") = DEFAULT_TRUNCATE);

    m.def("gaussian_high_pass", [](py::array_t<scalar_t, py::array::c_style | py::array::forcecast> image,
                                   scalar_t sigma) {
        return raster_to_numpy(gaussianHighPass(numpy_to_raster<scalar_t>(image), sigma));
    }, py::arg("image"), py::arg("sigma") = DEFAULT_HIGH_PASS_SIGMA);

    m.def("gaussian_laplace", [](py::array_t<scalar_t, py::array::c_style | py::array::forcecast> image,
                                 scalar_t sigma, scalar_t truncate) {
        return raster_to_numpy(gaussianLaplace(numpy_to_raster<scalar_t>(image), sigma, truncate));
    }, py::arg("image"), py::arg("sigma"), py::arg("truncate") = DEFAULT_TRUNCATE);

    // ==== Detection ====

    // Returns an (N, 3) array with one (row, col, sigma) row per blob
    m.def("blob_log", [](py::array_t<scalar_t, py::array::c_style | py::array::forcecast> image,
                         const BlobLogParams& params) {
        const std::vector<Blob> blobs = blobLog(numpy_to_raster<scalar_t>(image), params);
        py::array_t<scalar_t> out({static_cast<ssize_t>(blobs.size()), static_cast<ssize_t>(3)});
        auto view = out.mutable_unchecked<2>();
        for (size_t i = 0; i < blobs.size(); ++i) {
            view(i, 0) = blobs[i].row;
            view(i, 1) = blobs[i].col;
            view(i, 2) = blobs[i].sigma;
        }
        return out;
    }, py::arg("image"), py::arg("params") = BlobLogParams());

    m.def("detect_spots", [](py::array_t<scalar_t, py::array::c_style | py::array::forcecast> image,
                             scalar_t high_pass_sigma, scalar_t spot_threshold, scalar_t blob_sigma) {
        SpotDetectionParams params;
        params.high_pass_sigma = high_pass_sigma;
        params.threshold = spot_threshold;
        params.blob_sigma = blob_sigma;
        const SpotDetectionResult result = detectSpots(numpy_to_raster<scalar_t>(image), params);
        return py::make_tuple(points_to_numpy(result.coordinates),
                              py::array_t<scalar_t>(static_cast<ssize_t>(result.sizes.size()),
                                                    result.sizes.data()));
    }, py::arg("image"),
       py::arg("high_pass_sigma") = DEFAULT_HIGH_PASS_SIGMA,
       py::arg("spot_threshold") = DEFAULT_SPOT_THRESHOLD,
       py::arg("blob_sigma") = DEFAULT_BLOB_SIGMA);

    // ==== Nuclei ====

    // {label: (row, col)}
    m.def("region_centroids", [](py::array_t<label_t, py::array::c_style | py::array::forcecast> labels) {
        py::dict out;
        for (const auto& entry : regionCentroids(numpy_to_raster<label_t>(labels))) {
            out[py::int_(entry.first)] = py::make_tuple(entry.second.row, entry.second.col);
        }
        return out;
    }, py::arg("labels"));

    // Returns (labels, distances) index-aligned with the spots
    m.def("assign_spots", [](py::array_t<scalar_t, py::array::c_style | py::array::forcecast> spots,
                             py::array_t<label_t, py::array::c_style | py::array::forcecast> labels) {
        const SpotAssignment assignment =
            assignSpotsToNuclei(numpy_to_points(spots), regionCentroids(numpy_to_raster<label_t>(labels)));
        return py::make_tuple(
            py::array_t<label_t>(static_cast<ssize_t>(assignment.labels.size()), assignment.labels.data()),
            py::array_t<scalar_t>(static_cast<ssize_t>(assignment.distances.size()),
                                  assignment.distances.data()));
    }, py::arg("spots"), py::arg("labels"));

    // ==== Colors ====

    m.def("label_colors", [](const std::vector<label_t>& labels) {
        py::dict out;
        for (const auto& entry : labelColors(labels)) {
            out[py::int_(entry.first)] = rgba_to_tuple(entry.second);
        }
        return out;
    }, py::arg("labels"));

    m.def("colorize_label_map", [](py::array_t<label_t, py::array::c_style | py::array::forcecast> labels,
                                   const std::vector<label_t>& order) {
        const LabelMap label_map = numpy_to_raster<label_t>(labels);
        return raster_to_numpy(colorizeLabelMap(label_map, labelColors(order)));
    }, py::arg("labels"), py::arg("order"));

    // ==== I/O ====

    m.def("read_tiff", [](const std::string& path, int band, bool normalize) {
        const TiffImage tiff(path);
        if (band == 0) {
            return raster_to_numpy(tiff.readStack(normalize));
        }
        return raster_to_numpy(tiff.readBand(band, normalize));
    }, py::arg("path"), py::arg("band") = 1, py::arg("normalize") = true,
       "Read one band (1-based) of a TIFF file, or every page and band as a stack when band is 0");

    m.def("read_label_map", [](const std::string& path, int band) {
        return raster_to_numpy(readLabelMap(path, band));
    }, py::arg("path"), py::arg("band") = 1);
}
