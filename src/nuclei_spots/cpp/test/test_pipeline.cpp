/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests for the analysis pipeline
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include <catch2/catch.hpp>
#include "nuclei_spots/pipeline.hpp"
#include "nuclei_spots/tiff_io.hpp"
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gdal_priv.h>
#include <cpl_string.h>

using namespace nuclei_spots;

namespace {

// Two square nuclei with one spot at the center of each
struct Scene {
    Image spots;
    LabelMap labels;
};

Scene makeScene() {
    Scene scene{Image(64, 64), LabelMap(64, 64)};
    const Point2D centers[2] = {Point2D(20, 20), Point2D(44, 44)};
    for (size_t r = 0; r < 64; ++r) {
        for (size_t c = 0; c < 64; ++c) {
            for (const Point2D& p : centers) {
                const scalar_t dr = r - p.row;
                const scalar_t dc = c - p.col;
                scene.spots(r, c) += std::exp(-(dr * dr + dc * dc) / (2.0 * 1.5 * 1.5));
            }
            if (r >= 10 && r <= 30 && c >= 10 && c <= 30) scene.labels(r, c) = 1;
            if (r >= 34 && r <= 54 && c >= 34 && c <= 54) scene.labels(r, c) = 2;
        }
    }
    return scene;
}

PipelineConfig quietConfig() {
    PipelineConfig config;
    config.detection.threshold = 0.05;
    config.verbose = false;
    return config;
}

std::string tempDir(const std::string& tag) {
    static int counter = 0;
    return std::string("/tmp/test_nuclei_spots_") + tag + "_" +
           std::to_string(std::time(nullptr)) + "_" + std::to_string(counter++);
}

std::vector<std::string> readLines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string readAll(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// One Float32 page per image
void writePages(const std::vector<Image>& pages, const std::string& path) {
    GDALAllRegister();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    for (size_t p = 0; p < pages.size(); ++p) {
        const int width = static_cast<int>(pages[p].cols());
        const int height = static_cast<int>(pages[p].rows());
        char** options = nullptr;
        if (p > 0) {
            options = CSLSetNameValue(options, "APPEND_SUBDATASET", "YES");
        }
        GDALDataset* dataset = driver->Create(path.c_str(), width, height, 1, GDT_Float32, options);
        CSLDestroy(options);
        REQUIRE(dataset != nullptr);

        std::vector<scalar_t> buffer(pages[p].values());
        CPLErr err = dataset->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, width, height,
                                                         buffer.data(), width, height,
                                                         GDT_Float64, 0, 0);
        REQUIRE(err == CE_None);
        GDALClose(dataset);
    }
}

} // namespace

TEST_CASE("Pipeline analysis of in-memory rasters", "[Pipeline]") {
    const Scene scene = makeScene();
    const Pipeline pipeline(quietConfig());

    SECTION("Spots are detected, assigned and colored") {
        const PipelineResult result = pipeline.analyze(scene.spots, scene.labels);

        REQUIRE(result.spots.count() == 2);
        REQUIRE(result.filtered.shape() == scene.spots.shape());
        REQUIRE(result.nuclei.size() == 2);
        REQUIRE(result.nuclei[0].centroid == Point2D(20, 20));
        REQUIRE(result.nuclei[1].centroid == Point2D(44, 44));
        REQUIRE(result.nuclei[0].area == 21 * 21);

        REQUIRE(result.assignment.size() == 2);
        for (size_t i = 0; i < result.spots.count(); ++i) {
            const Point2D& p = result.spots.coordinates[i];
            const label_t expected = p.row < 32 ? 1 : 2;
            REQUIRE(result.assignment.labels[i] == expected);
            REQUIRE(result.assignment.distances[i] == Approx(0.0).margin(1e-12));
            REQUIRE(result.inside_labels[i] == expected);
        }

        REQUIRE(result.spot_counts.at(1) == 1);
        REQUIRE(result.spot_counts.at(2) == 1);
        REQUIRE(result.colors.at(1) == defaultPalette()[0]);
        REQUIRE(result.colors.at(2) == defaultPalette()[1]);
        REQUIRE(result.metrics.total_time_ms >= 0.0);
    }

    SECTION("Shape mismatch throws") {
        REQUIRE_THROWS_AS(pipeline.analyze(scene.spots, LabelMap(32, 64)), std::invalid_argument);
    }

    SECTION("Label map without nuclei throws") {
        REQUIRE_THROWS_AS(pipeline.analyze(scene.spots, LabelMap(64, 64)), std::invalid_argument);
    }

    SECTION("Spots without nuclei fall back to the nearest one") {
        LabelMap labels(64, 64);
        labels(5, 60) = 4;
        const PipelineResult result = pipeline.analyze(scene.spots, labels);
        REQUIRE(result.spots.count() == 2);
        REQUIRE(result.assignment.labels == std::vector<label_t>{4, 4});
        REQUIRE(result.inside_labels == std::vector<label_t>{0, 0});
        REQUIRE(result.spot_counts.at(4) == 2);
    }
}

TEST_CASE("Pipeline run from files", "[Pipeline]") {
    const Scene scene = makeScene();
    const std::string dir = tempDir("pipeline");
    std::filesystem::create_directories(dir);

    const std::string spots_file = dir + "/spots.tif";
    const std::string labels_file = dir + "/labels.tif";
    writeImage(scene.spots, spots_file);
    writeLabelMap(scene.labels, labels_file);

    PipelineConfig config = quietConfig();
    config.spots_path = spots_file;
    config.labels_path = labels_file;
    config.output_dir = dir + "/output";
    config.save_filtered = true;
    config.save_colored_labels = true;

    SECTION("Results are written") {
        const Pipeline pipeline(config);
        PipelineResult result = pipeline.run();
        REQUIRE(result.spots.count() == 2);
        pipeline.saveResults(result);

        const std::vector<std::string> spots_csv = readLines(config.output_dir + "/spots.csv");
        REQUIRE(spots_csv.size() == 3);
        REQUIRE(spots_csv[0] == "index,row,col,size,nucleus_label,distance,inside_label,r,g,b,a");

        const std::vector<std::string> nuclei_csv = readLines(config.output_dir + "/nuclei.csv");
        REQUIRE(nuclei_csv.size() == 3);
        REQUIRE(nuclei_csv[0] == "label,row,col,area,spot_count,r,g,b,a");
        REQUIRE(nuclei_csv[1].rfind("1,20,20,441,1,", 0) == 0);

        const std::string summary = readAll(config.output_dir + "/summary.json");
        REQUIRE(summary.find("\"num_spots\": 2") != std::string::npos);
        REQUIRE(summary.find("\"num_nuclei\": 2") != std::string::npos);
        REQUIRE(summary.find("\"spots_outside_nuclei\": 0") != std::string::npos);

        REQUIRE(TiffImage(config.output_dir + "/filtered.tif").bandCount() == 1);
        REQUIRE(TiffImage(config.output_dir + "/labels_colored.tif").bandCount() == 4);
    }

    SECTION("Nuclei image must match the label map") {
        const std::string nuclei_file = dir + "/nuclei.tif";
        writeImage(Image(32, 32), nuclei_file);
        config.nuclei_path = nuclei_file;
        REQUIRE_THROWS_AS(Pipeline(config).run(), std::invalid_argument);
    }

    SECTION("Missing inputs") {
        config.spots_path.clear();
        REQUIRE_THROWS_AS(Pipeline(config).run(), std::invalid_argument);
        config.spots_path = dir + "/missing.tif";
        REQUIRE_THROWS_AS(Pipeline(config).run(), std::runtime_error);
    }

    SECTION("Band out of range") {
        config.band = 2;
        REQUIRE_THROWS_AS(Pipeline(config).run(), std::invalid_argument);
    }

    SECTION("Spots spread over the pages of a stack") {
        // Each page holds one of the two spots
        Image first(64, 64);
        Image second(64, 64);
        for (size_t r = 0; r < 64; ++r) {
            for (size_t c = 0; c < 64; ++c) {
                if (c < 32) {
                    first(r, c) = scene.spots(r, c);
                } else {
                    second(r, c) = scene.spots(r, c);
                }
            }
        }
        const std::string stack_file = dir + "/stack.tif";
        writePages({first, second}, stack_file);
        REQUIRE(TiffImage(stack_file).pageCount() == 2);
        config.spots_path = stack_file;

        const PipelineResult first_page = Pipeline(config).run();
        REQUIRE(first_page.spots.count() == 1);
        REQUIRE(first_page.spots.coordinates[0] == Point2D(20, 20));

        config.max_project = true;
        const Pipeline pipeline(config);
        PipelineResult projected = pipeline.run();
        REQUIRE(projected.spots.count() == 2);
        REQUIRE(projected.spot_counts.at(1) == 1);
        REQUIRE(projected.spot_counts.at(2) == 1);

        pipeline.saveResults(projected);
        const std::string summary = readAll(config.output_dir + "/summary.json");
        REQUIRE(summary.find("\"max_project\": true") != std::string::npos);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Summary JSON escapes paths", "[Pipeline]") {
    const std::string dir = tempDir("json");
    std::filesystem::create_directories(dir);

    PipelineConfig config = quietConfig();
    config.spots_path = std::string("/data/a\"b\\c\nd\te") + '\x01' + "f.tif";
    config.labels_path = "/data/labels.tif";

    const std::string path = dir + "/summary.json";
    writeSummaryJson(PipelineResult(), config, path);

    const std::string summary = readAll(path);
    REQUIRE(summary.find(R"("spots_image": "/data/a\"b\\c\nd\te\u0001f.tif",)") !=
            std::string::npos);
    REQUIRE(summary.find(R"("label_map": "/data/labels.tif",)") != std::string::npos);
    REQUIRE(readLines(path).size() == 27);

    std::filesystem::remove_all(dir);
}
