#include "config/EvaluationConfig.h"
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace landmark_eval {

namespace {

bool parseBool(const std::string& key, const std::string& text) {
    if (text == "true" || text == "1" || text == "yes") return true;
    if (text == "false" || text == "0" || text == "no") return false;
    throw std::runtime_error("Invalid boolean for " + key + ": " + text);
}

double parseDouble(const std::string& key, const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid number for " + key + ": " + text);
    }
    if (consumed != text.size()) {
        throw std::runtime_error("Invalid number for " + key + ": " + text);
    }
    return value;
}

} // namespace

void EvaluationConfig::set(const std::string& key, const std::vector<std::string>& values) {
    if (key == "scales") {
        std::vector<int> parsed;
        for (const auto& v : values) {
            double scale = parseDouble(key, v);
            if (!(scale > 0) || scale > std::numeric_limits<int>::max() ||
                scale != std::floor(scale)) {
                throw std::runtime_error("Scale must be a positive integer: " + v);
            }
            parsed.push_back(static_cast<int>(scale));
        }
        scales = parsed;
        return;
    }

    if (values.size() != 1) {
        throw std::runtime_error("Expected one value for " + key);
    }
    const std::string& value = values[0];

    if (key == "std_coef") {
        std_coef = parseDouble(key, value);
        if (std_coef < 0) {
            throw std::runtime_error("std_coef must not be negative: " + value);
        }
    } else if (key == "use_affine") {
        use_affine = parseBool(key, value);
    } else if (key == "equal_size") {
        equal_size = parseBool(key, value);
    } else if (key == "verbose") {
        verbose = parseBool(key, value);
    } else {
        throw std::runtime_error("Unknown config key: " + key);
    }
}

EvaluationConfig EvaluationConfig::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + filepath);
    }

    EvaluationConfig config;
    std::string line;
    while (std::getline(file, line)) {
        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;  // Skip empty lines

        std::vector<std::string> values;
        std::string value;
        while (iss >> value) {
            values.push_back(value);
        }
        config.set(key, values);
    }

    file.close();
    return config;
}

void EvaluationConfig::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }

    file << "# Landmark evaluation settings" << std::endl;
    file << "std_coef " << std_coef << std::endl;
    file << "use_affine " << (use_affine ? "true" : "false") << std::endl;
    file << "equal_size " << (equal_size ? "true" : "false") << std::endl;
    file << "verbose " << (verbose ? "true" : "false") << std::endl;
    file << "scales";
    for (int scale : scales) {
        file << " " << scale;
    }
    file << std::endl;
    file.close();
}

} // namespace landmark_eval
