/**
 * Annotation Evaluation Tool
 *
 * Measures how well each annotator agrees with the consensus of all
 * annotators of the same image set:
 * - Landmark error statistics (count, mean, std, min, max, median)
 * - Image extent implied by the landmarks
 * - Number of correspondences inconsistent with an affine alignment
 *
 * Outputs:
 *   <output>/annotation_statistics.csv  one row per (annotator folder, image)
 *   <output>/summary.json               mean error per scale
 *
 * Usage:
 *   build/bin/evaluate_annotations --annotations <dir> --output <dir> \
 *                                  [--config <file>] [--affine] [--std-coef <v>] [--verbose]
 */

#include "config/EvaluationConfig.h"
#include "dataset/AnnotationCollection.h"
#include "analysis/LandmarkStatistics.h"
#include "alignment/OutlierClassifier.h"
#include "utils/PathUtils.h"
#include <iostream>
#include <iomanip>
#include <fstream>
#include <string>
#include <vector>
#include <map>
#include <cmath>

using namespace landmark_eval;

/**
 * One comparison of an annotation against the consensus
 */
struct EvaluationRow {
    std::string set_name;
    std::string user;
    int scale;
    std::string image;
    LandmarkStatistics stats;
    int num_outliers;
};

void writeStatisticsCSV(const std::vector<EvaluationRow>& rows, std::ofstream& file) {
    file << "set,user,scale,image,count,mean,std,min,max,median,"
         << "image_size_x,image_size_y,image_diagonal,outliers\n";
    file << std::setprecision(8);
    for (const auto& row : rows) {
        const LandmarkStatistics& s = row.stats;
        file << row.set_name << "," << row.user << "," << row.scale << "," << row.image << ","
             << s.count << "," << s.mean << "," << s.stddev << "," << s.min << "," << s.max << ","
             << s.median << "," << s.image_size.x() << "," << s.image_size.y() << ","
             << s.image_diagonal << "," << row.num_outliers << "\n";
    }
}

void writeSummaryJSON(const std::vector<EvaluationRow>& rows,
                      const EvaluationConfig& config,
                      std::ofstream& file) {
    file << "{\n";
    file << "  \"use_affine\": " << (config.use_affine ? "true" : "false") << ",\n";
    file << "  \"std_coef\": " << config.std_coef << ",\n";
    file << "  \"comparisons\": " << rows.size() << ",\n";
    file << "  \"scales\": {";

    bool first = true;
    for (int scale : config.scales) {
        double sum_mean = 0.0;
        int num = 0;
        int num_outliers = 0;
        for (const auto& row : rows) {
            if (row.scale != scale) continue;
            sum_mean += row.stats.mean;
            num_outliers += row.num_outliers;
            ++num;
        }
        if (!first) file << ",";
        first = false;
        file << "\n    \"" << scale << "\": {\"comparisons\": " << num
             << ", \"outliers\": " << num_outliers << ", \"mean_error\": ";
        if (num > 0) {
            file << std::fixed << std::setprecision(6) << sum_mean / num;
            file.unsetf(std::ios_base::floatfield);
        } else {
            file << "null";
        }
        file << "}";
    }
    file << "\n  }\n";
    file << "}\n";
}

int main(int argc, char* argv[]) {
    std::string annotations_dir;
    std::string output_dir;
    std::string config_path;
    std::string std_coef_arg;
    bool use_affine = false;
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
        } else if (arg == "--std-coef" && i + 1 < argc) {
            std_coef_arg = argv[++i];
        } else if (arg == "--affine") {
            use_affine = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            std::cerr << "Usage: " << argv[0]
                      << " --annotations <dir> --output <dir> [--config <file>] [--affine] [--std-coef <v>] [--verbose]"
                      << std::endl;
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
    try {
        if (!config_path.empty()) {
            config = EvaluationConfig::loadFromFile(config_path);
        }
        if (!std_coef_arg.empty()) {
            config.set("std_coef", {std_coef_arg});
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }
    if (use_affine) config.use_affine = true;
    if (verbose) config.verbose = true;

    annotations_dir = updatePath(annotations_dir);
    std::cout << "=== Annotation Evaluation ===" << std::endl;
    std::cout << "Annotations: " << annotations_dir << std::endl;
    std::cout << "Output: " << output_dir << std::endl;
    std::cout << "Affine alignment: " << (config.use_affine ? "yes" : "no") << std::endl;
    std::cout << "Outlier threshold: " << config.std_coef << " std" << std::endl;
    std::cout << std::endl;

    std::vector<AnnotationFolder> folders = collectAnnotationFolders(annotations_dir);
    if (folders.empty()) {
        std::cerr << "ERROR: No user-<name>_scale-<N>pc folders found in " << annotations_dir << std::endl;
        return 1;
    }

    if (!createDirectory(output_dir)) {
        std::cerr << "ERROR: Failed to create output folder: " << output_dir << std::endl;
        return 1;
    }

    std::vector<EvaluationRow> rows;
    int num_skipped = 0;

    for (const auto& set : groupBySet(folders)) {
        std::cout << "--- Set: " << set.first << " (" << set.second.size() << " folders) ---" << std::endl;

        std::vector<UserAnnotations> annotations = loadSetAnnotations(set.second);
        ConsensusCollection consensus;
        try {
            consensus = createConsensusLandmarks(annotations, config.equal_size);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: Consensus failed for set " << set.first << ": " << e.what() << std::endl;
            ++num_skipped;
            continue;
        }

        for (const auto& user : annotations) {
            const AnnotationFolder& folder = user.folder;

            for (const auto& entry : user.landmarks) {
                auto ref = consensus.landmarks.find(entry.first);
                if (ref == consensus.landmarks.end()) {
                    continue;
                }

                EvaluationRow row;
                row.set_name = set.first;
                row.user = folder.user;
                row.scale = folder.scale;
                row.image = entry.first;
                try {
                    row.stats = computeLandmarkStatistics(ref->second, entry.second, config.use_affine);
                    row.num_outliers = classifyOutliers(ref->second, entry.second, config.std_coef).numOutliers();
                } catch (const std::exception& e) {
                    std::cerr << "Warning: Skipping " << folder.path << "/" << entry.first
                              << ": " << e.what() << std::endl;
                    ++num_skipped;
                    continue;
                }

                if (config.verbose) {
                    std::cout << "  " << std::setw(12) << folder.user << " @" << std::setw(3) << folder.scale
                              << "% " << entry.first << ": mean " << std::fixed << std::setprecision(2)
                              << row.stats.mean << " px, max " << row.stats.max << " px, "
                              << row.num_outliers << " outliers" << std::endl;
                    std::cout.unsetf(std::ios_base::floatfield);
                }
                rows.push_back(row);
            }
        }
    }

    std::string csv_path = joinPath(output_dir, "annotation_statistics.csv");
    std::ofstream csv_file(csv_path);
    if (!csv_file.is_open()) {
        std::cerr << "ERROR: Failed to open file for writing: " << csv_path << std::endl;
        return 1;
    }
    writeStatisticsCSV(rows, csv_file);
    csv_file.close();

    std::string json_path = joinPath(output_dir, "summary.json");
    std::ofstream json_file(json_path);
    if (!json_file.is_open()) {
        std::cerr << "ERROR: Failed to open file for writing: " << json_path << std::endl;
        return 1;
    }
    writeSummaryJSON(rows, config, json_file);
    json_file.close();

    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Comparisons: " << rows.size() << std::endl;
    if (num_skipped > 0) {
        std::cout << "Skipped: " << num_skipped << std::endl;
    }
    std::cout << "Statistics: " << csv_path << std::endl;
    std::cout << "Summary: " << json_path << std::endl;

    return 0;
}
