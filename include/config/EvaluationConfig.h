#pragma once

#include <string>
#include <vector>

namespace landmark_eval {

/**
 * Settings of the annotation tools.
 *
 * The numerical core takes these values as explicit arguments; this struct
 * only collects the defaults and what the user overrides from a config file
 * or the command line.
 *
 * Config file format, one setting per line, '#' starts a comment:
 *   std_coef 3.0
 *   use_affine true
 *   scales 5 10 25 50 100
 */
struct EvaluationConfig {
    double std_coef = 5.0;      // Outlier threshold in population std
    bool use_affine = false;    // Statistics on affine-aligned errors
    bool equal_size = true;     // Trim consensus sets to the shortest one
    bool verbose = false;       // Per-image progress output

    // Scales (percent of full resolution) reported in the summary
    std::vector<int> scales = {5, 10, 25, 50, 100};

    /**
     * Load settings from file; keys not present keep their current value
     * @throws std::runtime_error on unreadable file, unknown key or bad value
     */
    static EvaluationConfig loadFromFile(const std::string& filepath);

    /**
     * Apply a single "key value..." setting
     * @throws std::runtime_error on unknown key or bad value
     */
    void set(const std::string& key, const std::vector<std::string>& values);

    /**
     * Save settings in the format read by loadFromFile
     */
    void saveToFile(const std::string& filepath) const;
};

} // namespace landmark_eval
