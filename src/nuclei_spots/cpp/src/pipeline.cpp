/**
 * @file pipeline.cpp
 * @brief Implementation of the spot detection and assignment pipeline
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/pipeline.hpp"
#include "nuclei_spots/tiff_io.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace nuclei_spots {

namespace {

using Clock = std::chrono::high_resolution_clock;

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

std::ofstream openOutput(const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    out << std::setprecision(10);
    return out;
}

void writeColor(std::ostream& out, const std::map<label_t, RGBA>& colors, label_t label) {
    auto it = colors.find(label);
    if (it == colors.end()) {
        out << ",0,0,0,0";
        return;
    }
    out << "," << it->second.r << "," << it->second.g << "," << it->second.b << ","
        << it->second.a;
}

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(ch));
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
    return out;
}

} // namespace

Pipeline::Pipeline(PipelineConfig config)
    : config_(std::move(config))
{
}

PipelineResult Pipeline::run() const {
    if (config_.spots_path.empty()) {
        throw std::invalid_argument("Pipeline: no spots image given");
    }
    if (config_.labels_path.empty()) {
        throw std::invalid_argument("Pipeline: no nucleus label map given");
    }

    const auto load_start = Clock::now();

    if (config_.verbose) {
        std::cout << "Loading spots image: " << config_.spots_path;
        if (config_.max_project) {
            std::cout << " (maximum projection)" << std::endl;
        } else {
            std::cout << " (band " << config_.band << ")" << std::endl;
        }
    }
    const TiffImage spots_file(config_.spots_path);
    if (config_.verbose) {
        std::cout << "  " << spots_file.width() << " x " << spots_file.height() << ", "
                  << spots_file.pageCount() << " page(s), "
                  << spots_file.bandCount() << " band(s), " << spots_file.sampleType()
                  << std::endl;
    }
    const Image spots_image = config_.max_project
                                  ? maxProjection(spots_file.readStack(config_.normalize))
                                  : spots_file.readBand(config_.band, config_.normalize);

    if (config_.verbose) {
        std::cout << "Loading label map: " << config_.labels_path << std::endl;
    }
    const LabelMap labels = readLabelMap(config_.labels_path);

    if (!config_.nuclei_path.empty()) {
        const TiffImage nuclei_file(config_.nuclei_path);
        if (static_cast<size_t>(nuclei_file.height()) != labels.rows() ||
            static_cast<size_t>(nuclei_file.width()) != labels.cols()) {
            throw std::invalid_argument(
                "Nuclei image " + config_.nuclei_path + " does not match label map shape " +
                LabelMap::shapeToString(labels.shape()));
        }
    }

    const double load_ms = elapsedMs(load_start);

    PipelineResult result = analyze(spots_image, labels);
    result.metrics.load_time_ms = load_ms;
    result.metrics.total_time_ms += load_ms;
    return result;
}

PipelineResult Pipeline::analyze(const Image& spots_image, const LabelMap& labels) const {
    requireImage2D(spots_image.shape(), "Pipeline");
    requireImage2D(labels.shape(), "Pipeline");
    if (spots_image.shape() != labels.shape()) {
        throw std::invalid_argument("Spots image shape " + Image::shapeToString(spots_image.shape()) +
                                    " does not match label map shape " +
                                    LabelMap::shapeToString(labels.shape()));
    }

    PipelineResult result;
    result.labels = labels;
    const auto total_start = Clock::now();

    // Filter and detect
    auto stage_start = Clock::now();
    result.spots = detectSpots(spots_image, config_.detection, result.filtered);
    result.metrics.detection_time_ms = elapsedMs(stage_start);
    if (config_.verbose) {
        std::cout << "Detected " << result.spots.count() << " spot(s)" << std::endl;
    }

    // Nucleus measurements
    stage_start = Clock::now();
    result.nuclei = regionProperties(labels);
    const CentroidTable centroids = centroidTable(result.nuclei);
    result.metrics.centroid_time_ms = elapsedMs(stage_start);
    if (config_.verbose) {
        std::cout << "Found " << result.nuclei.size() << " nucle"
                  << (result.nuclei.size() == 1 ? "us" : "i") << std::endl;
    }
    if (centroids.empty()) {
        throw std::invalid_argument("Label map " +
                                    (config_.labels_path.empty() ? std::string("(in memory)")
                                                                 : config_.labels_path) +
                                    " contains no nuclei");
    }

    // Nearest-nucleus assignment
    stage_start = Clock::now();
    result.assignment = assignSpotsToNuclei(result.spots.coordinates, centroids);
    result.inside_labels = labelsAtPoints(labels, result.spots.coordinates);
    result.spot_counts = countSpotsPerNucleus(result.assignment, centroids);
    result.metrics.assignment_time_ms = elapsedMs(stage_start);

    if (config_.verbose) {
        size_t outside = 0;
        for (label_t label : result.inside_labels) {
            if (label == BACKGROUND_LABEL) ++outside;
        }
        if (outside > 0) {
            std::cout << "Warning: " << outside << " spot(s) lie outside every nucleus" << std::endl;
        }
    }

    std::vector<label_t> order;
    order.reserve(result.nuclei.size());
    for (const RegionProperties& region : result.nuclei) {
        order.push_back(region.label);
    }
    result.colors = labelColors(order);

    result.metrics.total_time_ms = elapsedMs(total_start);
    return result;
}

void Pipeline::saveResults(PipelineResult& result) const {
    const auto save_start = Clock::now();

    std::error_code ec;
    std::filesystem::create_directories(config_.output_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + config_.output_dir +
                                 ": " + ec.message());
    }

    const std::string spots_file = config_.output_dir + "/spots.csv";
    writeSpotsCsv(result, spots_file);
    if (config_.verbose) {
        std::cout << "Spot table saved to " << spots_file << std::endl;
    }

    const std::string nuclei_file = config_.output_dir + "/nuclei.csv";
    writeNucleiCsv(result, nuclei_file);
    if (config_.verbose) {
        std::cout << "Nucleus table saved to " << nuclei_file << std::endl;
    }

    if (config_.save_filtered) {
        const std::string filtered_file = config_.output_dir + "/filtered.tif";
        writeImage(result.filtered, filtered_file);
        if (config_.verbose) {
            std::cout << "Filtered image saved to " << filtered_file << std::endl;
        }
    }

    if (config_.save_colored_labels) {
        const std::string colored_file = config_.output_dir + "/labels_colored.tif";
        writeRGBA(colorizeLabelMap(result.labels, result.colors), colored_file);
        if (config_.verbose) {
            std::cout << "Colored label map saved to " << colored_file << std::endl;
        }
    }

    result.metrics.save_time_ms = elapsedMs(save_start);

    // Written last so it carries the save time
    const std::string summary_file = config_.output_dir + "/summary.json";
    writeSummaryJson(result, config_, summary_file);
    if (config_.verbose) {
        std::cout << "Summary saved to " << summary_file << std::endl;
    }
}

void writeSpotsCsv(const PipelineResult& result, const std::string& path) {
    std::ofstream out = openOutput(path);
    out << "index,row,col,size,nucleus_label,distance,inside_label,r,g,b,a\n";

    const SpotDetectionResult& spots = result.spots;
    for (size_t i = 0; i < spots.count(); ++i) {
        const label_t nucleus = i < result.assignment.size() ? result.assignment.labels[i]
                                                             : BACKGROUND_LABEL;
        const scalar_t distance = i < result.assignment.size() ? result.assignment.distances[i]
                                                               : 0.0;
        const label_t inside = i < result.inside_labels.size() ? result.inside_labels[i]
                                                               : BACKGROUND_LABEL;
        out << i << "," << spots.coordinates[i].row << "," << spots.coordinates[i].col << ","
            << spots.sizes[i] << "," << nucleus << "," << distance << "," << inside;
        writeColor(out, result.colors, nucleus);
        out << "\n";
    }

    if (!out) {
        throw std::runtime_error("Failed to write " + path);
    }
}

void writeNucleiCsv(const PipelineResult& result, const std::string& path) {
    std::ofstream out = openOutput(path);
    out << "label,row,col,area,spot_count,r,g,b,a\n";

    for (const RegionProperties& region : result.nuclei) {
        auto count = result.spot_counts.find(region.label);
        out << region.label << "," << region.centroid.row << "," << region.centroid.col << ","
            << region.area << "," << (count == result.spot_counts.end() ? 0 : count->second);
        writeColor(out, result.colors, region.label);
        out << "\n";
    }

    if (!out) {
        throw std::runtime_error("Failed to write " + path);
    }
}

void writeSummaryJson(const PipelineResult& result, const PipelineConfig& config,
                      const std::string& path) {
    std::ofstream out = openOutput(path);
    const SpotDetectionParams& p = config.detection;
    const PipelineMetrics& m = result.metrics;

    size_t outside = 0;
    for (label_t label : result.inside_labels) {
        if (label == BACKGROUND_LABEL) ++outside;
    }

    out << "{\n";
    out << "  \"version\": \"" << NUCLEI_SPOTS_VERSION << "\",\n";
    out << "  \"spots_image\": \"" << jsonEscape(config.spots_path) << "\",\n";
    out << "  \"label_map\": \"" << jsonEscape(config.labels_path) << "\",\n";
    out << "  \"band\": " << config.band << ",\n";
    out << "  \"max_project\": " << (config.max_project ? "true" : "false") << ",\n";
    out << "  \"normalize\": " << (config.normalize ? "true" : "false") << ",\n";
    out << "  \"parameters\": {\n";
    out << "    \"high_pass_sigma\": " << p.high_pass_sigma << ",\n";
    out << "    \"threshold\": " << p.threshold << ",\n";
    out << "    \"blob_sigma\": " << p.blob_sigma << ",\n";
    out << "    \"min_sigma\": " << p.min_sigma << ",\n";
    out << "    \"overlap\": " << p.overlap << ",\n";
    out << "    \"exclude_border\": " << p.exclude_border << "\n";
    out << "  },\n";
    out << "  \"num_spots\": " << result.spots.count() << ",\n";
    out << "  \"num_nuclei\": " << result.nuclei.size() << ",\n";
    out << "  \"spots_outside_nuclei\": " << outside << ",\n";
    out << "  \"timings_ms\": {\n";
    out << "    \"total\": " << m.total_time_ms << ",\n";
    out << "    \"load\": " << m.load_time_ms << ",\n";
    out << "    \"detection\": " << m.detection_time_ms << ",\n";
    out << "    \"centroids\": " << m.centroid_time_ms << ",\n";
    out << "    \"assignment\": " << m.assignment_time_ms << ",\n";
    out << "    \"save\": " << m.save_time_ms << "\n";
    out << "  }\n";
    out << "}\n";

    if (!out) {
        throw std::runtime_error("Failed to write " + path);
    }
}

} // namespace nuclei_spots
