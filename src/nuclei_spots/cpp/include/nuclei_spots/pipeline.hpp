/**
 * @file pipeline.hpp
 * @brief End-to-end spot detection and nucleus assignment
 *
 * Loads a spots image and a nucleus label map, detects spots, measures the
 * nuclei, assigns every spot to its nearest nucleus and colors both with a
 * shared palette.
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_PIPELINE_HPP
#define NUCLEI_SPOTS_PIPELINE_HPP

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "nuclei_spots/common.hpp"
#include "nuclei_spots/image.hpp"
#include "nuclei_spots/spot_detector.hpp"
#include "nuclei_spots/regions.hpp"
#include "nuclei_spots/nucleus_assignment.hpp"
#include "nuclei_spots/color_cycle.hpp"

namespace nuclei_spots {

/**
 * @struct PipelineConfig
 * @brief Inputs, parameters and output switches of a pipeline run
 */
struct PipelineConfig {
    std::string spots_path;             ///< Image with the spots (required)
    std::string labels_path;            ///< Nucleus label map (required)
    std::string nuclei_path;            ///< Nucleus intensity image, shape-checked only (optional)
    int band = 1;                       ///< Band of the spots image to analyze
    bool max_project = false;           ///< Analyze the maximum projection of every page and band instead
    bool normalize = true;              ///< Scale integer samples to [0, 1]
    SpotDetectionParams detection;

    std::string output_dir = "./output";
    bool save_filtered = false;
    bool save_colored_labels = false;
    bool verbose = true;
};

/**
 * @struct PipelineMetrics
 * @brief Wall time of each pipeline stage
 */
struct PipelineMetrics {
    double total_time_ms = 0.0;
    double load_time_ms = 0.0;
    double detection_time_ms = 0.0;
    double centroid_time_ms = 0.0;
    double assignment_time_ms = 0.0;
    double save_time_ms = 0.0;

    void reset() {
        total_time_ms = 0.0;
        load_time_ms = 0.0;
        detection_time_ms = 0.0;
        centroid_time_ms = 0.0;
        assignment_time_ms = 0.0;
        save_time_ms = 0.0;
    }

    void print(std::ostream& os = std::cout) const {
        os << "Performance Metrics:" << std::endl;
        os << "  Total time: " << total_time_ms << " ms" << std::endl;

        if (total_time_ms > 0) {
            os << "  Load: " << load_time_ms << " ms ("
               << (load_time_ms / total_time_ms * 100.0) << "%)" << std::endl;
            os << "  Filter + detect: " << detection_time_ms << " ms ("
               << (detection_time_ms / total_time_ms * 100.0) << "%)" << std::endl;
            os << "  Centroids: " << centroid_time_ms << " ms ("
               << (centroid_time_ms / total_time_ms * 100.0) << "%)" << std::endl;
            os << "  Assignment: " << assignment_time_ms << " ms ("
               << (assignment_time_ms / total_time_ms * 100.0) << "%)" << std::endl;
        }
        if (save_time_ms > 0) {
            os << "  Save: " << save_time_ms << " ms" << std::endl;
        }
    }
};

/**
 * @struct PipelineResult
 * @brief Everything a run produces, index-aligned with the spot list
 */
struct PipelineResult {
    Image filtered;                          ///< High-pass filtered spots image
    LabelMap labels;                         ///< Nucleus label map as loaded
    SpotDetectionResult spots;
    std::vector<RegionProperties> nuclei;    ///< Ascending label order
    SpotAssignment assignment;               ///< Nearest nucleus per spot
    std::vector<label_t> inside_labels;      ///< Label under each spot (0 = background)
    std::map<label_t, size_t> spot_counts;
    std::map<label_t, RGBA> colors;          ///< Shared by nuclei and their spots
    PipelineMetrics metrics;
};

/**
 * @class Pipeline
 * @brief Runs the analysis on in-memory rasters or on files
 */
class Pipeline {
public:
    explicit Pipeline(PipelineConfig config);

    const PipelineConfig& config() const { return config_; }

    /**
     * @brief Load the configured files and analyze them
     * @throws std::runtime_error if a file cannot be read
     * @throws std::invalid_argument on bad parameters or mismatched shapes
     */
    PipelineResult run() const;

    /**
     * @brief Analyze rasters that are already in memory
     * @param spots_image 2-D spots image
     * @param labels Nucleus label map of the same shape
     * @throws std::invalid_argument on bad parameters or mismatched shapes,
     *         or if the label map holds no nuclei
     */
    PipelineResult analyze(const Image& spots_image, const LabelMap& labels) const;

    /**
     * @brief Write CSV tables, the JSON summary and optional rasters
     * @throws std::runtime_error if an output file cannot be written
     */
    void saveResults(PipelineResult& result) const;

private:
    PipelineConfig config_;
};

/**
 * @brief Write one row per spot
 */
void writeSpotsCsv(const PipelineResult& result, const std::string& path);

/**
 * @brief Write one row per nucleus
 */
void writeNucleiCsv(const PipelineResult& result, const std::string& path);

/**
 * @brief Write counts, parameters and timings as JSON
 */
void writeSummaryJson(const PipelineResult& result, const PipelineConfig& config,
                      const std::string& path);

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_PIPELINE_HPP
