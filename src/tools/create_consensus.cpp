/**
 * Consensus Creation Tool
 *
 * Fuses the landmarks of all annotators into one consensus set per image:
 * 1. Find user-<name>_scale-<N>pc folders below the annotation root
 * 2. Rescale every annotation to full image resolution
 * 3. Average corresponding landmarks over all annotators of an image set
 * 4. Write one CSV per image to <output>/<set>/
 *
 * Usage:
 *   build/bin/create_consensus --annotations <dir> --output <dir> \
 *                              [--config <file>] [--no-equal-size] [--verbose]
 */

#include "config/EvaluationConfig.h"
#include "dataset/AnnotationCollection.h"
#include "utils/PathUtils.h"
#include <iostream>
#include <string>
#include <vector>
#include <map>

using namespace landmark_eval;

int main(int argc, char* argv[]) {
    std::string annotations_dir;
    std::string output_dir;
    std::string config_path;
    bool no_equal_size = false;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--annotations" && i + 1 < argc) {
            annotations_dir = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--no-equal-size") {
            no_equal_size = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            std::cerr << "Usage: " << argv[0]
                      << " --annotations <dir> --output <dir> [--config <file>] [--no-equal-size] [--verbose]" << std::endl;
            return 1;
        } else {
            std::cerr << "Warning: Ignoring unknown argument " << arg << std::endl;
        }
    }

    if (annotations_dir.empty() || output_dir.empty()) {
        std::cerr << "Error: --annotations and --output are required" << std::endl;
        return 1;
    }

    EvaluationConfig config;
    if (!config_path.empty()) {
        try {
            config = EvaluationConfig::loadFromFile(config_path);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }
    if (no_equal_size) config.equal_size = false;
    if (verbose) config.verbose = true;

    annotations_dir = updatePath(annotations_dir);
    std::cout << "=== Landmark Consensus ===" << std::endl;
    std::cout << "Annotations: " << annotations_dir << std::endl;
    std::cout << "Output: " << output_dir << std::endl;
    std::cout << "Equal size: " << (config.equal_size ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    std::vector<AnnotationFolder> folders = collectAnnotationFolders(annotations_dir);
    if (folders.empty()) {
        std::cerr << "ERROR: No user-<name>_scale-<N>pc folders found in " << annotations_dir << std::endl;
        return 1;
    }
    std::cout << "Found " << folders.size() << " annotation folders" << std::endl;

    if (!createDirectory(output_dir)) {
        std::cerr << "ERROR: Failed to create output folder: " << output_dir << std::endl;
        return 1;
    }

    std::map<std::string, std::vector<AnnotationFolder>> sets = groupBySet(folders);
    int num_written = 0;
    int num_failed = 0;

    for (const auto& set : sets) {
        std::cout << "\n--- Set: " << set.first << " (" << set.second.size() << " folders) ---" << std::endl;

        ConsensusCollection consensus;
        try {
            consensus = createConsensusLandmarks(set.second, config.equal_size);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: Consensus failed for set " << set.first << ": " << e.what() << std::endl;
            ++num_failed;
            continue;
        }

        std::string set_dir = joinPath(output_dir, set.first);
        if (!createDirectory(set_dir)) {
            std::cerr << "ERROR: Failed to create output folder: " << set_dir << std::endl;
            ++num_failed;
            continue;
        }

        for (const auto& entry : consensus.landmarks) {
            std::string path = joinPath(set_dir, entry.first);
            if (!entry.second.saveToCSV(path)) {
                ++num_failed;
                continue;
            }
            ++num_written;
            if (config.verbose) {
                std::cout << "  " << entry.first << ": " << entry.second.size() << " landmarks from "
                          << consensus.annotation_counts[entry.first] << " annotations" << std::endl;
            }
        }
        std::cout << "Wrote " << consensus.landmarks.size() << " consensus files to " << set_dir << std::endl;
    }

    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Consensus files written: " << num_written << std::endl;
    if (num_failed > 0) {
        std::cerr << "Failures: " << num_failed << std::endl;
        return 1;
    }
    return 0;
}
