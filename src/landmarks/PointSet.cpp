#include "landmarks/PointSet.h"
#include "utils/Errors.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <algorithm>

namespace landmark_eval {

namespace {

std::vector<std::string> splitCSVLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(line);
    while (std::getline(iss, field, ',')) {
        // Strip whitespace and a trailing '\r' from files written on Windows
        size_t begin = field.find_first_not_of(" \t\r\"");
        size_t end = field.find_last_not_of(" \t\r\"");
        fields.push_back(begin == std::string::npos ? "" : field.substr(begin, end - begin + 1));
    }
    if (!line.empty() && line.back() == ',') {
        fields.push_back("");
    }
    return fields;
}

bool parseNumber(const std::string& text, double& value) {
    if (text.empty()) return false;
    try {
        size_t consumed = 0;
        value = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

void checkTwoColumns(const Eigen::MatrixXd& points, const std::string& what) {
    if (points.cols() != 2) {
        throw DimensionMismatchError(what + " must have exactly 2 coordinate columns, got "
                                     + std::to_string(points.cols()));
    }
}

PointSet::PointSet(const Eigen::MatrixXd& points,
                   const std::string& x_label,
                   const std::string& y_label)
    : x_label_(x_label), y_label_(y_label) {
    checkTwoColumns(points, "PointSet");
    points_ = points;
}

bool PointSet::loadFromCSV(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open landmark file: " << filepath << std::endl;
        return false;
    }

    std::vector<Eigen::Vector2d> rows;
    std::string x_label = "X";
    std::string y_label = "Y";
    std::string line;
    bool first_line = true;
    size_t num_fields = 0;  // fixed by the first non-empty row
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;  // Skip empty lines

        std::vector<std::string> fields = splitCSVLine(line);
        if (fields.size() < 2) {
            std::cerr << "Malformed landmark row " << line_number << " in " << filepath << std::endl;
            return false;
        }
        if (num_fields == 0) {
            num_fields = fields.size();
        } else if (fields.size() != num_fields) {
            std::cerr << "Landmark row " << line_number << " in " << filepath << " has "
                      << fields.size() << " fields, expected " << num_fields << std::endl;
            return false;
        }

        // The last two fields are the coordinates, anything before is the index
        const std::string& x_field = fields[fields.size() - 2];
        const std::string& y_field = fields[fields.size() - 1];
        double x, y;
        bool numeric = parseNumber(x_field, x) && parseNumber(y_field, y);

        if (!numeric) {
            if (first_line) {
                x_label = x_field;
                y_label = y_field;
                first_line = false;
                continue;
            }
            std::cerr << "Non-numeric landmark row " << line_number << " in " << filepath << std::endl;
            return false;
        }

        first_line = false;
        rows.emplace_back(x, y);
    }

    file.close();

    points_.resize(static_cast<Eigen::Index>(rows.size()), 2);
    for (size_t i = 0; i < rows.size(); ++i) {
        points_.row(static_cast<Eigen::Index>(i)) = rows[i].transpose();
    }
    x_label_ = x_label;
    y_label_ = y_label;
    return true;
}

bool PointSet::saveToCSV(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << "," << x_label_ << "," << y_label_ << "\n";
    file << std::setprecision(10);
    for (Eigen::Index i = 0; i < points_.rows(); ++i) {
        file << i << "," << points_(i, 0) << "," << points_(i, 1) << "\n";
    }

    file.close();
    return true;
}

void PointSet::addPoint(double x, double y) {
    Eigen::Index n = points_.rows();
    points_.conservativeResize(n + 1, 2);
    points_(n, 0) = x;
    points_(n, 1) = y;
}

PointSet PointSet::head(size_t n) const {
    Eigen::Index rows = std::min(points_.rows(), static_cast<Eigen::Index>(n));
    return PointSet(points_.topRows(rows), x_label_, y_label_);
}

PointSet PointSet::scaled(double factor) const {
    return PointSet(points_ * factor, x_label_, y_label_);
}

} // namespace landmark_eval
