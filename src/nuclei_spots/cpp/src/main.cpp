// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "nuclei_spots/common.hpp"
#include "nuclei_spots/pipeline.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <exception>
#include <map>
#include <stdexcept>

using namespace nuclei_spots;

// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --spots FILE --labels FILE [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --spots FILE             TIFF image containing the spots (required)\n";
    std::cout << "  --labels FILE            TIFF nucleus label map, 0 = background (required)\n";
    std::cout << "  --nuclei FILE            Nucleus image, checked against the label map shape\n";
    std::cout << "  --band N                 Band of the spots image to analyze (default: 1)\n";
    std::cout << "  --max-project            Analyze the maximum projection of all pages and bands\n";
    std::cout << "  --high-pass-sigma S      Gaussian high-pass width (default: 2)\n";
    std::cout << "  --threshold T            Blob detection threshold (default: 0.01)\n";
    std::cout << "  --blob-sigma S           Blob scale (default: 2)\n";
    std::cout << "  --min-sigma S            Smallest blob scale (default: 1)\n";
    std::cout << "  --overlap F              Blob overlap fraction for pruning (default: 0.5)\n";
    std::cout << "  --exclude-border N       Ignore spots within N pixels of the edge (default: 0)\n";
    std::cout << "  --no-normalize           Keep raw integer sample values\n";
    std::cout << "  --output-dir DIR         Output directory (default: ./output)\n";
    std::cout << "  --save-filtered          Save the high-pass filtered image\n";
    std::cout << "  --save-colored-labels    Save the label map colored like the spots\n";
    std::cout << "  --quiet                  Only print errors\n";
    std::cout << "  --help                   Display this help message\n";
}

// Parse command-line arguments
std::map<std::string, std::string> parse_args(int argc, char* argv[]) {
    std::map<std::string, std::string> args;

    // Set default values
    args["band"] = "1";
    args["high-pass-sigma"] = "2.0";
    args["threshold"] = "0.01";
    args["blob-sigma"] = "2.0";
    args["min-sigma"] = "1.0";
    args["overlap"] = "0.5";
    args["exclude-border"] = "0";
    args["output-dir"] = "./output";
    args["normalize"] = "true";
    args["max-project"] = "false";
    args["save-filtered"] = "false";
    args["save-colored-labels"] = "false";
    args["quiet"] = "false";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "--max-project") {
            args["max-project"] = "true";
        } else if (arg == "--no-normalize") {
            args["normalize"] = "false";
        } else if (arg == "--save-filtered") {
            args["save-filtered"] = "true";
        } else if (arg == "--save-colored-labels") {
            args["save-colored-labels"] = "true";
        } else if (arg == "--quiet") {
            args["quiet"] = "true";
        } else if (i + 1 < argc) {
            if (arg == "--spots") {
                args["spots"] = argv[++i];
            } else if (arg == "--labels") {
                args["labels"] = argv[++i];
            } else if (arg == "--nuclei") {
                args["nuclei"] = argv[++i];
            } else if (arg == "--band") {
                args["band"] = argv[++i];
            } else if (arg == "--high-pass-sigma") {
                args["high-pass-sigma"] = argv[++i];
            } else if (arg == "--threshold") {
                args["threshold"] = argv[++i];
            } else if (arg == "--blob-sigma") {
                args["blob-sigma"] = argv[++i];
            } else if (arg == "--min-sigma") {
                args["min-sigma"] = argv[++i];
            } else if (arg == "--overlap") {
                args["overlap"] = argv[++i];
            } else if (arg == "--exclude-border") {
                args["exclude-border"] = argv[++i];
            } else if (arg == "--output-dir") {
                args["output-dir"] = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                std::exit(1);
            }
        } else {
            std::cerr << "Missing argument for option: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    return args;
}

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    auto args = parse_args(argc, argv);

    if (args.find("spots") == args.end() || args.find("labels") == args.end()) {
        std::cerr << "Both --spots and --labels are required\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        PipelineConfig config;
        config.spots_path = args["spots"];
        config.labels_path = args["labels"];
        if (args.find("nuclei") != args.end()) {
            config.nuclei_path = args["nuclei"];
        }
        config.band = std::stoi(args["band"]);
        config.max_project = args["max-project"] == "true";
        config.normalize = args["normalize"] == "true";
        config.detection.high_pass_sigma = std::stod(args["high-pass-sigma"]);
        config.detection.threshold = std::stod(args["threshold"]);
        config.detection.blob_sigma = std::stod(args["blob-sigma"]);
        config.detection.min_sigma = std::stod(args["min-sigma"]);
        config.detection.overlap = std::stod(args["overlap"]);
        const long exclude_border = std::stol(args["exclude-border"]);
        if (exclude_border < 0) {
            throw std::invalid_argument("--exclude-border must be non-negative, got " +
                                        args["exclude-border"]);
        }
        config.detection.exclude_border = static_cast<size_t>(exclude_border);
        config.output_dir = args["output-dir"];
        config.save_filtered = args["save-filtered"] == "true";
        config.save_colored_labels = args["save-colored-labels"] == "true";
        config.verbose = args["quiet"] != "true";

        // Display configuration
        if (config.verbose) {
            std::cout << "Nuclei/Spots Analysis " << version() << "\n";
            std::cout << "  High-pass sigma: " << config.detection.high_pass_sigma << "\n";
            std::cout << "  Threshold: " << config.detection.threshold << "\n";
            std::cout << "  Blob sigma: " << config.detection.blob_sigma << "\n";
            std::cout << "  Overlap: " << config.detection.overlap << "\n";
            std::cout << "  Exclude border: " << config.detection.exclude_border << "\n";
            std::cout << "  Output Directory: " << config.output_dir << "\n";
            std::cout << std::endl;
        }

        Pipeline pipeline(config);
        PipelineResult result = pipeline.run();
        pipeline.saveResults(result);

        if (config.verbose) {
            std::cout << "\nAssigned " << result.spots.count() << " spot(s) to "
                      << result.nuclei.size() << " nuclei" << std::endl;
            result.metrics.print();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
